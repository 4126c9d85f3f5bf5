#include "capturepush/plugin_exception.hpp"

PluginException::PluginException(std::string type, std::string code, std::string di) :
    GenericException(type + " (" + code + "): " + di), type(type), code(code), debuginfo(di)
{
}

nlohmann::json PluginException::toJSON() {
    return {
        {"what", what()},
        {"type", type},
        {"code", code},
        {"debuginfo", debuginfo},
    };
}

IntegrityException::IntegrityException(std::string code, std::string expected, std::string actual) :
    PluginException("integrity-error", code, "expected sha256 " + expected + ", downloaded artifact has " + actual),
    expected(expected), actual(actual)
{
}

NotFoundException::NotFoundException(std::string code, std::string di) :
    PluginException("not-found", code, di)
{
}

LoadException::LoadException(std::string code, std::string di) :
    PluginException("load-error", code, di)
{
}

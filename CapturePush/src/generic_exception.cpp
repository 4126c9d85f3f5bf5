#include "capturepush/generic_exception.hpp"

GenericException::GenericException() :
    _message("")
{
}

GenericException::GenericException(std::string message) :
    _message(message)
{
}

const char * GenericException::what() const noexcept {
    return _message.c_str();
}

nlohmann::json GenericException::toJSON() {
    return {
        {"what", what()},
    };
}

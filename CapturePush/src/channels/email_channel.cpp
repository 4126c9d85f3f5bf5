#include "capturepush/channels/email_channel.hpp"

#include "MailCore/MailCore.h"

using namespace mailcore;

#define AS_MCSTR(X)         mailcore::String::uniquedStringWithUTF8Characters(X.c_str())

EmailChannel::EmailChannel(std::string host, int port, std::string sender, std::string password, std::string receiver, long timeoutSeconds, std::shared_ptr<spdlog::logger> logger) :
    _host(host), _port(port), _sender(sender), _password(password), _receiver(receiver), _timeoutSeconds(timeoutSeconds), _logger(logger)
{
}

bool EmailChannel::send(std::string subject, std::string content) {
    AutoreleasePool pool;
    ErrorCode err = ErrorNone;

    MessageBuilder builder;
    builder.header()->setFrom(Address::addressWithMailbox(AS_MCSTR(_sender)));
    builder.header()->setTo(Array::arrayWithObject(Address::addressWithMailbox(AS_MCSTR(_receiver))));
    builder.header()->setSubject(AS_MCSTR(subject));
    builder.header()->setUserAgent(MCSTR("CapturePush"));
    builder.header()->setDate(time(0));
    builder.setTextBody(AS_MCSTR(content));

    SMTPSession smtp;
    smtp.setHostname(AS_MCSTR(_host));
    smtp.setPort(_port);
    smtp.setUsername(AS_MCSTR(_sender));
    smtp.setPassword(AS_MCSTR(_password));
    smtp.setTimeout(_timeoutSeconds);
    if (_port == 465) {
        smtp.setConnectionType(ConnectionTypeTLS);
    } else if (_port == 25) {
        smtp.setConnectionType(ConnectionTypeClear);
    } else {
        smtp.setConnectionType(ConnectionTypeStartTLS);
    }

    _logger->info("Sending email to {} via {}:{}", _receiver, _host, _port);
    smtp.sendMessage(builder.data(), NULL, &err);

    if (err != ErrorNone) {
        _logger->error("-X An SMTP error occurred: {} LibEtPan code: {}", (int)err, smtp.lastLibetpanError());
        return false;
    }
    return true;
}

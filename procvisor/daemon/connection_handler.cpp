#include "connection_handler.h"
#include "supervisor.h"
#include "../shared/errors.h"
#include "../shared/logging.h"

const char* state_name(connection_state s)
{
    switch (s)
    {
        case connection_state::detect:         return "detect";
        case connection_state::read_request:   return "read_request";
        case connection_state::dispatch:       return "dispatch";
        case connection_state::write_response: return "write_response";
        case connection_state::error:          return "error";
        case connection_state::close:          return "close";
    }
    return "unknown";
}

connection_handler::connection_handler(supervisor& sv, scoped_fd fd)
    : m_sv(sv), m_config(sv.config()), m_fd(std::move(fd))
{
}

std::optional<wire_protocol> connection_handler::protocol() const
{
    if (!m_codec)
        return std::nullopt;
    return m_codec->protocol();
}

void connection_handler::run() noexcept
{
    while (m_state != connection_state::close)
    {
        try
        {
            step();
        }
        catch (const peer_closed_error& e)
        {
            LOG_DEBUG(std::string("connection: ") + e.what());
            m_state = connection_state::close;
        }
        catch (const protocol_error& e)
        {
            fail(e.what());
        }
        catch (const std::exception& e)
        {
            LOG_ERROR(std::string("connection: unexpected failure in ") + state_name(m_state) + ": " + e.what());
            fail(e.what());
        }
        catch (...)
        {
            LOG_ERROR(std::string("connection: non-standard exception in ") + state_name(m_state));
            fail("Internal error");
        }
    }

    m_fd.reset();
}

void connection_handler::step()
{
    switch (m_state)
    {
        case connection_state::detect:         on_detect(); break;
        case connection_state::read_request:   on_read_request(); break;
        case connection_state::dispatch:       on_dispatch(); break;
        case connection_state::write_response: on_write_response(); break;
        case connection_state::error:          on_error(); break;
        case connection_state::close:          break;
    }
}

void connection_handler::fail(std::string message)
{
    // An error while already reporting an error, or after the response went
    // out, only gets logged.
    if (m_state == connection_state::error || m_write_attempted)
    {
        LOG_DEBUG("connection: " + message);
        m_state = connection_state::close;
        return;
    }

    m_error = std::move(message);
    m_state = connection_state::error;
}

void connection_handler::on_detect()
{
    wire_protocol p = detect_protocol(m_fd.get(), m_config.detect_timeout, m_config.max_message_size);
    m_codec = make_codec(p, m_fd.get(), m_config.max_message_size);

    if (!m_fd.set_io_timeout(m_config.read_timeout))
        LOG_DEBUG("connection: could not set socket timeouts");

    m_state = connection_state::read_request;
}

void connection_handler::on_read_request()
{
    std::string payload = m_codec->read_message();
    m_request = parse_request(payload);
    m_state = connection_state::dispatch;
}

void connection_handler::on_dispatch()
{
    LOG_DEBUG("connection: " + std::string(protocol_name(m_codec->protocol())) + " request '" +
              m_request->command + "'");
    m_response = m_sv.execute(*m_request);
    m_state = connection_state::write_response;
}

std::string connection_handler::encode_response()
{
    std::string payload = serialize(m_response);
    if (payload.size() >= m_config.max_message_size)
    {
        LOG_WARN("connection: response of " + std::to_string(payload.size()) + " bytes exceeds the limit");
        payload = serialize(make_error("Response too large (" + std::to_string(payload.size()) + " bytes)"));
    }
    return payload;
}

void connection_handler::on_write_response()
{
    std::string payload = encode_response();
    m_write_attempted = true;

    try
    {
        m_codec->write_message(payload);
    }
    catch (const protocol_error& e)
    {
        // Framed delivery failed part-way; one last unframed attempt.
        if (m_codec->protocol() == wire_protocol::framed)
        {
            LOG_DEBUG(std::string("connection: framed write failed (") + e.what() + "), retrying unframed");
            write_all(m_fd.get(), payload);
        }
        else
        {
            throw;
        }
    }

    m_state = connection_state::close;
}

void connection_handler::on_error()
{
    LOG_WARN("connection: " + m_error);

    m_response = make_error(m_error);

    // Detection never ran (or failed): answer unframed.
    if (!m_codec)
        m_codec = make_codec(wire_protocol::legacy, m_fd.get(), m_config.max_message_size);

    on_write_response();
}

#include "ProbeOutcome.hpp"

#include <stdexcept>

std::string_view to_string(ProbeStatus status) {
    switch (status) {
        case ProbeStatus::Success:         return "Success";
        case ProbeStatus::Timeout:         return "Timeout";
        case ProbeStatus::ConnectionError: return "ConnectionError";
        case ProbeStatus::ProtocolError:   return "ProtocolError";
        case ProbeStatus::AuthError:       return "AuthError";
    }

    return "Unknown";
}

ProbeOutcome ProbeOutcome::success(std::string server_id, std::chrono::system_clock::time_point issued_at,
                                   std::chrono::milliseconds duration, TokenUsage tokens, std::string reply) {
    ProbeOutcome out;

    out.server_id = std::move(server_id);
    out.issued_at = issued_at;
    out.duration = duration;
    out.status = ProbeStatus::Success;
    out.tokens = tokens;
    out.reply = std::move(reply);

    return out;
}

ProbeOutcome ProbeOutcome::failure(std::string server_id, std::chrono::system_clock::time_point issued_at,
                                   std::chrono::milliseconds duration, ProbeStatus status, std::string detail) {
    if (status == ProbeStatus::Success) throw std::invalid_argument("failure outcome cannot carry Success");

    ProbeOutcome out;

    out.server_id = std::move(server_id);
    out.issued_at = issued_at;
    out.duration = duration;
    out.status = status;
    out.error_detail = std::move(detail);

    return out;
}

#pragma once

/// @file response_writer.hpp
/// @brief Boundary to the component that serializes responses to the client.

namespace agw::service {

class ExchangeContext;

/// Writes the context's resolved response to the client connection.
/// Called exactly once per logical request.
class ResponseWriter {
public:
    virtual ~ResponseWriter() = default;

    virtual void write(const ExchangeContext& ctx) = 0;
};

}  // namespace agw::service

/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <fmt/format.h>
#include <msgpack.hpp>

#include <source_location>
#include <string>

//-------------------------------------------------------------------------

namespace colend::serialization
{

//-------------------------------------------------------------------------

class BinaryStream
{
    msgpack::sbuffer m_underlying;

public:
    explicit BinaryStream(size_t initByteSize = MSGPACK_SBUFFER_INIT_SIZE)
        : m_underlying{initByteSize}
    {}

    [[nodiscard]] const char* data() const noexcept { return m_underlying.data(); }
    [[nodiscard]] size_t size() const noexcept { return m_underlying.size(); }

    void write(const char* buf, size_t len) { m_underlying.write(buf, len); }
};

//-------------------------------------------------------------------------

struct MsgPackError : msgpack::type_error
{
    std::string message;

    explicit MsgPackError(
        std::string_view reason = {},
        std::source_location sl = std::source_location::current()) noexcept
    {
        message = fmt::format(
            "{}#L{}: {}{}{}",
            sl.file_name(),
            sl.line(),
            msgpack::type_error::what(),
            reason.empty() ? "" : ": ",
            reason);
    }

    const char* what() const noexcept override { return message.c_str(); }
};

//-------------------------------------------------------------------------

// Persisted layouts are msgpack arrays whose element count is fixed per version.
inline void expectArray(
    const msgpack::object& o,
    uint32_t size,
    std::source_location sl = std::source_location::current())
{
    if (o.type != msgpack::type::ARRAY) {
        throw MsgPackError{"expected an array", sl};
    }
    if (o.via.array.size != size) {
        throw MsgPackError{
            fmt::format("expected {} elements, got {}", size, o.via.array.size), sl};
    }
}

//-------------------------------------------------------------------------

}  // namespace colend::serialization

//-------------------------------------------------------------------------

// Copyright (c) Giacomo Drago <giacomo@giacomodrago.com>
// All rights reserved.

// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
// 1. Redistributions of source code must retain the above copyright
//    notice, this list of conditions and the following disclaimer.
// 2. Redistributions in binary form must reproduce the above copyright
//    notice, this list of conditions and the following disclaimer in the
//    documentation and/or other materials provided with the distribution.
// 3. Neither the name of Giacomo Drago nor the
//    names of its contributors may be used to endorse or promote products
//    derived from this software without specific prior written permission.

// THIS SOFTWARE IS PROVIDED BY GIACOMO DRAGO "AS IS" AND ANY
// EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED
// WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL GIACOMO DRAGO BE LIABLE FOR ANY
// DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES
// (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES;
// LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND
// ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
// (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
// SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#include "typedjson.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// An error type with a domain-specific kind on top of the three the engine
// needs
struct app_error
{
    enum kind_type
    {
        SYNTAX,
        SHAPE,
        MISSING,
        INVALID_PORT,
        INVALID_NAME,
    };

    kind_type kind;
    std::string detail;
    std::size_t line = 0;
    std::size_t column = 0;

    static app_error unexpected(const std::string_view description)
    {
        return {SHAPE, std::string(description)};
    }

    static app_error format_error(
        const std::size_t line,
        const std::size_t column,
        const std::string_view message)
    {
        return {SYNTAX, std::string(message), line, column};
    }

    static app_error missing_field(const std::string_view field_name)
    {
        return {MISSING, std::string(field_name)};
    }

    static app_error invalid_port(const std::uint64_t port)
    {
        return {INVALID_PORT, std::to_string(port)};
    }

    static app_error invalid_name(const std::string_view name)
    {
        return {INVALID_NAME, std::string(name)};
    }
};

static_assert(typedjson::is_visitor_error_v<app_error>);

// Non-empty, ASCII letters and digits only; only available with app_error
struct name
{
    std::string text;
};

class name_visitor final : public typedjson::place_base<name, app_error>
{
private:

    static bool is_alphanumeric(const char c) noexcept
    {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')
            || (c >= '0' && c <= '9');
    }

public:

    using typedjson::place_base<name, app_error>::place_base;

    void string(const std::string_view s) override
    {
        if (s.empty() || !std::all_of(s.begin(), s.end(), is_alphanumeric))
        {
            throw app_error::invalid_name(s);
        }

        this->assign(name {std::string(s)});
    }
};

// TCP port, 1 to 65535; only available with app_error
struct port
{
    std::uint16_t number = 0;
};

class port_visitor final : public typedjson::place_base<port, app_error>
{
public:

    using typedjson::place_base<port, app_error>::place_base;

    void nonnegative(const std::uint64_t n) override
    {
        if (n == 0 || n > 65535)
        {
            throw app_error::invalid_port(n);
        }

        this->assign(port {static_cast<std::uint16_t>(n)});
    }
};

// Keeps the literal as written
struct decimal
{
    std::string digits;
};

template<typename Error>
class decimal_visitor final : public typedjson::place_base<decimal, Error>
{
public:

    using typedjson::place_base<decimal, Error>::place_base;

    void number(const std::string_view raw) override
    {
        this->assign(decimal {std::string(raw)});
    }

    // Also accepted as a quoted string, as long as it is a JSON number
    void string(const std::string_view s) override
    {
        if (!typedjson::detail::is_valid_number(s))
        {
            throw Error::unexpected("decimal string");
        }

        this->assign(decimal {std::string(s)});
    }
};

// Reuses the built-in double visitor, then validates
struct temperature
{
    double celsius = 0;
};

template<typename Error>
class temperature_visitor final : public typedjson::place_base<temperature, Error>
{
public:

    using typedjson::place_base<temperature, Error>::place_base;

    void number(const std::string_view raw) override
    {
        std::optional<double> celsius;
        typedjson::place<double, Error>(celsius).number(raw);

        if (*celsius < -273.15)
        {
            throw Error::unexpected("temperature below absolute zero");
        }

        this->assign(temperature {*celsius});
    }
};

struct server
{
    name host;
    port listen;
    std::optional<temperature> max_temperature;
};

namespace typedjson
{

template<>
struct deserialize<name, app_error>
{
    static name_visitor begin(std::optional<name>& out)
    {
        return name_visitor(out);
    }
};

template<>
struct deserialize<port, app_error>
{
    static port_visitor begin(std::optional<port>& out)
    {
        return port_visitor(out);
    }
};

template<typename Error>
struct deserialize<decimal, Error>
{
    static decimal_visitor<Error> begin(std::optional<decimal>& out)
    {
        return decimal_visitor<Error>(out);
    }
};

template<typename Error>
struct deserialize<temperature, Error>
{
    static temperature_visitor<Error> begin(std::optional<temperature>& out)
    {
        return temperature_visitor<Error>(out);
    }
};

template<>
struct struct_options<server> : struct_options_base
{
    using error_type = app_error;
};

template<>
struct struct_description<server>
{
    static auto fields()
    {
        return std::make_tuple(
            field("host", &server::host),
            field("listen", &server::listen),
            field("max_temperature", &server::max_temperature));
    }
};

} // namespace typedjson

TEST(typedjson_place_specializations, name)
{
    ASSERT_EQ(
        "Abc123",
        (typedjson::from_string<name, app_error>("\"Abc123\"").text));

    // A well-formed string that fails validation is a domain error, not a
    // shape error
    for (const char* const json : {"\"a b!\"", "\"\"", "\"caf\\u00e9\""})
    {
        try
        {
            typedjson::from_string<name, app_error>(json);
            FAIL() << json;
        }
        catch (const app_error& e)
        {
            ASSERT_EQ(app_error::INVALID_NAME, e.kind) << json;
        }
    }

    try
    {
        typedjson::from_string<name, app_error>("\"a b!\"");
        FAIL();
    }
    catch (const app_error& e)
    {
        ASSERT_EQ("a b!", e.detail);
    }

    // Every other shape keeps the default behavior
    try
    {
        typedjson::from_string<name, app_error>("42");
        FAIL();
    }
    catch (const app_error& e)
    {
        ASSERT_EQ(app_error::SHAPE, e.kind);
        ASSERT_EQ("nonnegative integer", e.detail);
    }

    const auto names =
        typedjson::from_string<std::vector<std::optional<name>>, app_error>(
            "[\"a\", null, \"b\"]");
    ASSERT_EQ(3U, names.size());
    ASSERT_EQ("a", names[0]->text);
    ASSERT_FALSE(names[1].has_value());
    ASSERT_EQ("b", names[2]->text);
}

TEST(typedjson_place_specializations, decimal)
{
    const auto values = typedjson::from_string<std::vector<decimal>>(
        "[1.10, -0.000, 1e400, \"12.50\"]");
    ASSERT_EQ(4U, values.size());
    ASSERT_EQ("1.10", values[0].digits);
    ASSERT_EQ("-0.000", values[1].digits);
    ASSERT_EQ("1e400", values[2].digits);
    ASSERT_EQ("12.50", values[3].digits);

    try
    {
        typedjson::from_string<decimal>("\"12,50\"");
        FAIL();
    }
    catch (const typedjson::error& e)
    {
        ASSERT_EQ("decimal string", e.message());
    }
}

TEST(typedjson_place_specializations, temperature)
{
    ASSERT_DOUBLE_EQ(
        -40.0,
        typedjson::from_string<temperature>("-40").celsius);
    ASSERT_DOUBLE_EQ(
        21.5,
        typedjson::from_string<temperature>("21.5").celsius);

    try
    {
        typedjson::from_string<temperature>("-300");
        FAIL();
    }
    catch (const typedjson::error& e)
    {
        ASSERT_EQ("temperature below absolute zero", e.message());
    }

    try
    {
        typedjson::from_string<temperature>("1e400");
        FAIL();
    }
    catch (const typedjson::error& e)
    {
        ASSERT_EQ("number out of range", e.message());
    }
}

TEST(typedjson_place_specializations, custom_error_type)
{
    // struct_options<server>::error_type selects app_error
    const server s = typedjson::from_string<server>(
        "{\"host\": \"Abc123\", \"listen\": 8080}");
    ASSERT_EQ("Abc123", s.host.text);
    ASSERT_EQ(8080, s.listen.number);
    ASSERT_FALSE(s.max_temperature.has_value());

    try
    {
        typedjson::from_string<server>(
            "{\"host\": \"gateway\", \"listen\": 0}");
        FAIL();
    }
    catch (const app_error& e)
    {
        ASSERT_EQ(app_error::INVALID_PORT, e.kind);
        ASSERT_EQ("0", e.detail);
    }

    try
    {
        typedjson::from_string<server>(
            "{\"host\": \"a b!\", \"listen\": 80}");
        FAIL();
    }
    catch (const app_error& e)
    {
        ASSERT_EQ(app_error::INVALID_NAME, e.kind);
        ASSERT_EQ("a b!", e.detail);
    }

    try
    {
        typedjson::from_string<server>("{\"host\": \"a\",\n \"listen\" 80}");
        FAIL();
    }
    catch (const app_error& e)
    {
        ASSERT_EQ(app_error::SYNTAX, e.kind);
        ASSERT_EQ(2U, e.line);
        ASSERT_EQ(11U, e.column);
    }

    try
    {
        typedjson::from_string<server>("{\"host\": \"a\"}");
        FAIL();
    }
    catch (const app_error& e)
    {
        ASSERT_EQ(app_error::MISSING, e.kind);
        ASSERT_EQ("listen", e.detail);
    }

    try
    {
        typedjson::from_string<server>(
            "{\"host\": \"a\", \"listen\": 1, \"max_temperature\": -500}");
        FAIL();
    }
    catch (const app_error& e)
    {
        ASSERT_EQ(app_error::SHAPE, e.kind);
        ASSERT_EQ("temperature below absolute zero", e.detail);
    }
}

TEST(typedjson_place_specializations, explicit_error_type)
{
    // The same types work with any error type, given explicitly
    const auto values =
        typedjson::from_string<std::vector<int>, app_error>("[1, 2]");
    ASSERT_EQ(2U, values.size());

    try
    {
        typedjson::from_string<std::vector<name>, app_error>("[\"x\", 1]");
        FAIL();
    }
    catch (const app_error& e)
    {
        ASSERT_EQ(app_error::SHAPE, e.kind);
        ASSERT_EQ("nonnegative integer", e.detail);
    }

    try
    {
        typedjson::from_string<int, app_error>("\n  tru");
        FAIL();
    }
    catch (const app_error& e)
    {
        ASSERT_EQ(app_error::SYNTAX, e.kind);
        ASSERT_EQ("invalid literal", e.detail);
        ASSERT_EQ(2U, e.line);
        ASSERT_EQ(3U, e.column);
    }
}

int main(int argc, char** argv)
{
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

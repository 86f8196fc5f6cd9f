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

#include <cstdint>
#include <stdexcept>
#include <string>

struct envelope
{
    std::string kind;
    typedjson::value payload;
};

namespace typedjson
{

template<>
struct struct_description<envelope>
{
    static auto fields()
    {
        return std::make_tuple(
            field("kind", &envelope::kind),
            field("payload", &envelope::payload).with_default());
    }
};

} // namespace typedjson

TEST(typedjson_value, default_constructed)
{
    const typedjson::value v;

    ASSERT_EQ(typedjson::Null, v.type());
    ASSERT_TRUE(v.is_null());
    ASSERT_EQ(0U, v.size());
    ASSERT_EQ(nullptr, v.find("x"));
    ASSERT_THROW(v.as<int>(), typedjson::bad_value_cast);
    ASSERT_THROW(v.as_array(), typedjson::bad_value_cast);
    ASSERT_THROW(v.as_object(), typedjson::bad_value_cast);
}

TEST(typedjson_value, scalars)
{
    using typedjson::value;

    const value t = typedjson::from_string<value>("true");
    ASSERT_EQ(typedjson::Boolean, t.type());
    ASSERT_TRUE(t.as<bool>());

    const value s = typedjson::from_string<value>("\"hello\\tworld\"");
    ASSERT_EQ(typedjson::String, s.type());
    ASSERT_EQ("hello\tworld", s.as<std::string>());
    ASSERT_EQ("hello\tworld", s.as<std::string_view>());

    const value n = typedjson::from_string<value>("null");
    ASSERT_EQ(typedjson::Null, n.type());

    const value u = typedjson::from_string<value>("42");
    ASSERT_EQ(typedjson::Number, u.type());
    ASSERT_EQ(42, u.as<int>());
    ASSERT_EQ(42U, u.as<std::uint8_t>());
    ASSERT_DOUBLE_EQ(42.0, u.as<double>());

    const value i = typedjson::from_string<value>("-7");
    ASSERT_EQ(-7, i.as<int>());
    ASSERT_THROW(i.as<unsigned>(), std::range_error);

    const value d = typedjson::from_string<value>("2.5e-1");
    ASSERT_DOUBLE_EQ(0.25, d.as<double>());
    ASSERT_FLOAT_EQ(0.25F, d.as<float>());
    ASSERT_THROW(d.as<int>(), std::range_error);

    const value big = typedjson::from_string<value>("300");
    ASSERT_THROW(big.as<std::int8_t>(), std::range_error);
    ASSERT_EQ(300, big.as<std::int16_t>());

    ASSERT_THROW(u.as<std::string>(), typedjson::bad_value_cast);
    ASSERT_THROW(u.as<bool>(), typedjson::bad_value_cast);
    ASSERT_THROW(s.as<int>(), typedjson::bad_value_cast);
    ASSERT_THROW(t.as<double>(), typedjson::bad_value_cast);

    const value tiny = typedjson::from_string<value>("[1e-400]");
    ASSERT_EQ(typedjson::Number, tiny.as_array()[0].type());
    ASSERT_EQ(0.0, tiny.as_array()[0].as<double>());

    // Out of the range of double: there is no Number to hold it
    ASSERT_THROW(
        typedjson::from_string<value>("-1e400"),
        typedjson::error);
}

TEST(typedjson_value, document)
{
    const typedjson::value v = typedjson::from_string<typedjson::value>(R"({
        "name": "typedjson",
        "version": [1, 0, 3],
        "stable": true,
        "license": null,
        "deps": {"gtest": ">=1.10"}
    })");

    ASSERT_EQ(typedjson::Object, v.type());
    ASSERT_EQ(5U, v.size());

    const auto& members = v.as_object();
    ASSERT_EQ("name", members[0].first);
    ASSERT_EQ("version", members[1].first);
    ASSERT_EQ("deps", members[4].first);

    ASSERT_EQ("typedjson", v.find("name")->as<std::string>());
    ASSERT_TRUE(v.find("stable")->as<bool>());
    ASSERT_TRUE(v.find("license")->is_null());
    ASSERT_EQ(nullptr, v.find("missing"));

    const typedjson::value& version = *v.find("version");
    ASSERT_EQ(typedjson::Array, version.type());
    ASSERT_EQ(3U, version.size());
    ASSERT_EQ(3, version.as_array()[2].as<int>());

    ASSERT_EQ(">=1.10", v.find("deps")->find("gtest")->as<std::string>());

    ASSERT_THROW(v.as<std::string>(), typedjson::bad_value_cast);
    ASSERT_THROW(v.as_array(), typedjson::bad_value_cast);
    ASSERT_THROW(version.as_object(), typedjson::bad_value_cast);
    ASSERT_EQ(nullptr, version.find("name"));
}

TEST(typedjson_value, duplicate_keys)
{
    const typedjson::value v =
        typedjson::from_string<typedjson::value>(R"({"a": 1, "b": 2, "a": 3})");

    ASSERT_EQ(2U, v.size());
    ASSERT_EQ("a", v.as_object()[0].first);
    ASSERT_EQ(3, v.as_object()[0].second.as<int>());
    ASSERT_EQ("b", v.as_object()[1].first);
}

TEST(typedjson_value, equality)
{
    const std::string json = R"([1, -1, 1.5, "x", null, true, {"k": []}])";

    const auto a = typedjson::from_string<typedjson::value>(json);
    const auto b = typedjson::from_string<typedjson::value>(json);
    ASSERT_TRUE(a == b);
    ASSERT_FALSE(a != b);

    const auto c =
        typedjson::from_string<typedjson::value>(R"([1, -1, 1.5, "x"])");
    ASSERT_TRUE(a != c);

    ASSERT_EQ(typedjson::value(true), typedjson::from_string<typedjson::value>("true"));
    ASSERT_EQ(
        typedjson::value(std::string("s")),
        typedjson::from_string<typedjson::value>("\"s\""));
}

TEST(typedjson_value, inside_struct)
{
    const envelope e = typedjson::from_string<envelope>(
        R"({"kind": "event", "payload": {"ids": [1, 2, 3]}})");
    ASSERT_EQ("event", e.kind);
    ASSERT_EQ(3U, e.payload.find("ids")->size());

    const envelope empty = typedjson::from_string<envelope>(R"({"kind": "ping"})");
    ASSERT_TRUE(empty.payload.is_null());
}

int main(int argc, char** argv)
{
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

#ifndef TYPEDJSON_H
#define TYPEDJSON_H

#include <array>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#ifndef TJ_NESTING_LIMIT
#define TJ_NESTING_LIMIT 128
#endif

namespace typedjson
{

namespace detail
{

// Trick to prevent static_assert() from always going off
template<typename>
inline constexpr bool type_dependent_false = false;

template<typename Error, typename = void>
struct is_visitor_error : std::false_type
{
};

template<typename Error>
struct is_visitor_error<
    Error,
    std::void_t<
        decltype(Error::unexpected(std::declval<std::string_view>())),
        decltype(Error::format_error(
            std::declval<std::size_t>(),
            std::declval<std::size_t>(),
            std::declval<std::string_view>())),
        decltype(Error::missing_field(std::declval<std::string_view>()))>>
: std::bool_constant<
    std::is_convertible_v<
        decltype(Error::unexpected(std::declval<std::string_view>())),
        Error> &&
    std::is_convertible_v<
        decltype(Error::format_error(
            std::declval<std::size_t>(),
            std::declval<std::size_t>(),
            std::declval<std::string_view>())),
        Error> &&
    std::is_convertible_v<
        decltype(Error::missing_field(std::declval<std::string_view>())),
        Error>>
{
};

} // namespace detail

// An error capability is any type providing the three static factories below.
// The engine throws the values they return.
//
//   static Error unexpected(std::string_view description);
//   static Error format_error(
//       std::size_t line, std::size_t column, std::string_view message);
//   static Error missing_field(std::string_view field_name);
template<typename Error>
inline constexpr bool is_visitor_error_v =
    detail::is_visitor_error<Error>::value;

// Default error capability
class error : public std::exception
{
public:

    enum error_kind
    {
        UNEXPECTED,
        FORMAT_ERROR,
        MISSING_FIELD,
    };

private:

    error_kind m_kind;
    std::size_t m_line;
    std::size_t m_column;
    std::string m_message;
    std::string m_what;

    explicit error(
        const error_kind kind,
        const std::size_t line,
        const std::size_t column,
        const std::string_view message)
    : m_kind(kind)
    , m_line(line)
    , m_column(column)
    , m_message(message)
    {
        switch (m_kind)
        {
        case UNEXPECTED:
            m_what = "unexpected value: " + m_message;
            break;
        case FORMAT_ERROR:
            m_what = m_message +
                " at line " + std::to_string(m_line) +
                " column " + std::to_string(m_column);
            break;
        case MISSING_FIELD:
            m_what = "missing field `" + m_message + "`";
            break;
        }
    }

public:

    static error unexpected(const std::string_view description)
    {
        return error(UNEXPECTED, 0, 0, description);
    }

    static error format_error(
        const std::size_t line,
        const std::size_t column,
        const std::string_view message)
    {
        return error(FORMAT_ERROR, line, column, message);
    }

    static error missing_field(const std::string_view field_name)
    {
        return error(MISSING_FIELD, 0, 0, field_name);
    }

    error_kind kind() const noexcept
    {
        return m_kind;
    }

    // Only meaningful for FORMAT_ERROR, 0 otherwise
    std::size_t line() const noexcept
    {
        return m_line;
    }

    // Only meaningful for FORMAT_ERROR, 0 otherwise
    std::size_t column() const noexcept
    {
        return m_column;
    }

    // The description, the syntax error message or the field name,
    // depending on kind()
    const std::string& message() const noexcept
    {
        return m_message;
    }

    const char* what() const noexcept override
    {
        return m_what.c_str();
    }
}; // class error

// LCOV_EXCL_START
inline std::ostream& operator<<(
    std::ostream& out,
    const error::error_kind kind)
{
    switch (kind)
    {
        case error::UNEXPECTED:
            return out << "UNEXPECTED";
        case error::FORMAT_ERROR:
            return out << "FORMAT_ERROR";
        case error::MISSING_FIELD:
            return out << "MISSING_FIELD";
    }

    return out << "UNKNOWN";
}
// LCOV_EXCL_STOP

struct parse_options
{
    // Maximum number of arrays and objects open at the same time
    std::size_t nesting_limit = TJ_NESTING_LIMIT;
};

namespace detail
{

class context_base
{
private:

    std::size_t m_nesting_level = 0;

public:

    explicit context_base() noexcept = default;
    context_base(const context_base&) = delete;
    context_base(context_base&&) = delete;
    context_base& operator=(const context_base&) = delete;
    context_base& operator=(context_base&&) = delete;

    void begin_nested() noexcept
    {
        ++m_nesting_level;
    }

    void end_nested() noexcept
    {
        if (m_nesting_level > 0)
        {
            --m_nesting_level;
        }
    }

    std::size_t nesting_level() const noexcept
    {
        return m_nesting_level;
    }
}; // class context_base

} // namespace detail

// Holds the whole input and the parser state: read cursor, 1-indexed
// line/column of the next character, nesting level and a scratch buffer
// for decoded string literals. Columns count bytes.
class buffer_context final : public detail::context_base
{
private:

    const char* const m_buffer;
    const std::size_t m_length;
    std::size_t m_read_offset = 0;
    std::size_t m_line = 1;
    std::size_t m_column = 1;
    std::string m_literal;

public:

    explicit buffer_context(
        const char* const buffer,
        const std::size_t length) noexcept
    : m_buffer(buffer)
    , m_length(length)
    {
    }

    explicit buffer_context(const std::string_view json) noexcept
    : buffer_context(json.data(), json.size())
    {
    }

    bool at_end() const noexcept
    {
        return m_read_offset >= m_length;
    }

    // Must not be called at_end()
    char peek() const noexcept
    {
        return m_buffer[m_read_offset];
    }

    // Must not be called at_end()
    char read() noexcept
    {
        const char c = m_buffer[m_read_offset++];

        if (c == '\n')
        {
            ++m_line;
            m_column = 1;
        }
        else
        {
            ++m_column;
        }

        return c;
    }

    std::size_t read_offset() const noexcept
    {
        return m_read_offset;
    }

    std::size_t line() const noexcept
    {
        return m_line;
    }

    std::size_t column() const noexcept
    {
        return m_column;
    }

    std::string_view slice(
        const std::size_t begin,
        const std::size_t end) const noexcept
    {
        return {m_buffer + begin, end - begin};
    }

    void begin_literal() noexcept
    {
        m_literal.clear();
    }

    void write(const char c)
    {
        m_literal.push_back(c);
    }

    // Valid until the next call to begin_literal()
    std::string_view current_literal() const noexcept
    {
        return m_literal;
    }
}; // class buffer_context

enum class token_type
{
    Null,
    True,
    False,
    Number,
    String,
    BeginArray,
    EndArray,
    BeginObject,
    EndObject,
    Comma,
    Colon,
    EndOfInput,
    Invalid,
};

struct token
{
    token_type type = token_type::Invalid;

    // Position of the first character of the token
    std::size_t line = 0;
    std::size_t column = 0;

    // Number: the raw literal, pointing into the input.
    // String: the decoded string, pointing into the context scratch buffer
    // and valid until the next token is read.
    std::string_view payload;
};

namespace detail
{

inline bool is_whitespace(const char c) noexcept
{
    switch (c)
    {
    case ' ':
    case '\n':
    case '\r':
    case '\t':
        return true;
    }

    return false;
}

// There is an std::isdigit() but it depends on the locale
inline bool is_digit(const char c) noexcept
{
    return c >= '0' && c <= '9';
}

inline bool is_hex_digit(const char c) noexcept
{
    return is_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

// Characters that can appear in a number literal, well-formed or not
inline bool is_number_char(const char c) noexcept
{
    switch (c)
    {
    case '+':
    case '-':
    case '.':
    case 'e':
    case 'E':
        return true;
    default:
        return is_digit(c);
    }
}

// This exception is thrown internally by the functions dealing with UTF-16
// escape sequences and is not propagated outside of the library
struct encoding_error
{
};

inline std::uint32_t utf16_to_utf32(std::uint16_t high, std::uint16_t low)
{
    if (high <= 0xD7FF || high >= 0xE000)
    {
        if (low != 0)
        {
            // Since the high code unit is not a surrogate, the low code unit
            // should be zero
            throw encoding_error();
        }

        return high;
    }

    if (high > 0xDBFF) // we already know high >= 0xD800
    {
        throw encoding_error();
    }

    if (low < 0xDC00 || low > 0xDFFF)
    {
        throw encoding_error();
    }

    high -= 0xD800;
    low -= 0xDC00;

    return 0x010000 + ((static_cast<std::uint32_t>(high) << 10) | low);
}

inline std::array<std::uint8_t, 4> utf32_to_utf8(const std::uint32_t utf32_char)
{
    std::array<std::uint8_t, 4> result {};

    if (utf32_char <= 0x00007F)
    {
        result[0] = static_cast<std::uint8_t>(utf32_char);
    }
    else if (utf32_char <= 0x0007FF)
    {
        result[0] = static_cast<std::uint8_t>(0xC0 | (utf32_char >> 6));
        result[1] = static_cast<std::uint8_t>(0x80 | (utf32_char & 0x3F));
    }
    else if (utf32_char <= 0x00FFFF)
    {
        result[0] = static_cast<std::uint8_t>(0xE0 | (utf32_char >> 12));
        result[1] =
            static_cast<std::uint8_t>(0x80 | ((utf32_char >> 6) & 0x3F));
        result[2] = static_cast<std::uint8_t>(0x80 | (utf32_char & 0x3F));
    }
    else if (utf32_char <= 0x10FFFF)
    {
        result[0] = static_cast<std::uint8_t>(0xF0 | (utf32_char >> 18));
        result[1] =
            static_cast<std::uint8_t>(0x80 | ((utf32_char >> 12) & 0x3F));
        result[2] =
            static_cast<std::uint8_t>(0x80 | ((utf32_char >> 6) & 0x3F));
        result[3] = static_cast<std::uint8_t>(0x80 | (utf32_char & 0x3F));
    }
    else
    {
        throw encoding_error();
    }

    return result;
}

inline std::uint16_t parse_utf16_escape_sequence(
    const std::array<char, 4>& sequence)
{
    std::uint16_t result = 0;

    for (const char c : sequence)
    {
        std::uint16_t digit;
        if (is_digit(c))
        {
            digit = static_cast<std::uint16_t>(c - '0');
        }
        else if (c >= 'a' && c <= 'f')
        {
            digit = static_cast<std::uint16_t>(c - 'a' + 10);
        }
        else if (c >= 'A' && c <= 'F')
        {
            digit = static_cast<std::uint16_t>(c - 'A' + 10);
        }
        else
        {
            throw encoding_error();
        }

        result = static_cast<std::uint16_t>((result << 4) | digit);
    }

    return result;
}

// Writes the encoded character. Only the first byte may be zero (U+0000).
inline void write_utf8_char(
    buffer_context& context,
    const std::array<std::uint8_t, 4>& c)
{
    context.write(static_cast<char>(c[0]));

    for (std::size_t i = 1; i < c.size() && c[i]; ++i)
    {
        context.write(static_cast<char>(c[i]));
    }
}

// Copies one raw UTF-8 encoded character whose lead byte was just read,
// rejecting overlong forms, encoded surrogates and code points above U+10FFFF
template<typename Error>
void copy_utf8_char(
    buffer_context& context,
    const char first,
    const std::size_t line,
    const std::size_t column)
{
    const auto lead = static_cast<unsigned char>(first);

    std::size_t length = 0;
    unsigned char min = 0x80;
    unsigned char max = 0xBF;

    if (lead >= 0xC2 && lead <= 0xDF)
    {
        length = 2;
    }
    else if (lead == 0xE0)
    {
        length = 3;
        min = 0xA0;
    }
    else if (lead == 0xED)
    {
        length = 3;
        max = 0x9F;
    }
    else if (lead >= 0xE1 && lead <= 0xEF)
    {
        length = 3;
    }
    else if (lead == 0xF0)
    {
        length = 4;
        min = 0x90;
    }
    else if (lead >= 0xF1 && lead <= 0xF3)
    {
        length = 4;
    }
    else if (lead == 0xF4)
    {
        length = 4;
        max = 0x8F;
    }
    else
    {
        throw Error::format_error(line, column, "invalid UTF-8 sequence");
    }

    context.write(first);

    for (std::size_t i = 1; i < length; ++i)
    {
        if (context.at_end())
        {
            throw Error::format_error(
                context.line(), context.column(), "unterminated string");
        }

        const std::size_t next_line = context.line();
        const std::size_t next_column = context.column();
        const char next = context.read();
        const auto byte = static_cast<unsigned char>(next);

        if (byte < min || byte > max)
        {
            throw Error::format_error(
                next_line, next_column, "invalid UTF-8 sequence");
        }

        min = 0x80;
        max = 0xBF;
        context.write(next);
    }
}

// Parses a string enclosed in quotes, dealing with escape sequences.
// Assumes the opening quote has already been read.
template<typename Error>
std::string_view parse_string(buffer_context& context)
{
    context.begin_literal();

    enum
    {
        CHARACTER,
        ESCAPE_SEQUENCE,
        UTF16_SEQUENCE,
        CLOSED
    } state = CHARACTER;

    std::array<char, 4> utf16_seq {};
    std::size_t utf16_seq_offset = 0;
    std::uint16_t high_surrogate = 0;

    // Position of the backslash of the current escape sequence
    std::size_t escape_line = 0;
    std::size_t escape_column = 0;

    while (state != CLOSED)
    {
        if (context.at_end())
        {
            throw Error::format_error(
                context.line(), context.column(), "unterminated string");
        }

        const std::size_t line = context.line();
        const std::size_t column = context.column();
        const char c = context.read();

        switch (state)
        {
        case CHARACTER:
            if (c == '\\')
            {
                escape_line = line;
                escape_column = column;
                state = ESCAPE_SEQUENCE;
            }
            else if (high_surrogate != 0)
            {
                throw Error::format_error(
                    line, column, "expected UTF-16 low surrogate");
            }
            else if (c == '"')
            {
                state = CLOSED;
            }
            else if (static_cast<unsigned char>(c) < 0x20)
            {
                throw Error::format_error(
                    line, column, "control character in string");
            }
            else if (static_cast<unsigned char>(c) < 0x80)
            {
                context.write(c);
            }
            else
            {
                copy_utf8_char<Error>(context, c, line, column);
            }
            break;

        case ESCAPE_SEQUENCE:
            state = CHARACTER;

            if (high_surrogate != 0 && c != 'u')
            {
                throw Error::format_error(
                    escape_line,
                    escape_column,
                    "expected UTF-16 low surrogate");
            }

            switch (c)
            {
            case '"':
                context.write('"');
                break;
            case '\\':
                context.write('\\');
                break;
            case '/':
                context.write('/');
                break;
            case 'b':
                context.write('\b');
                break;
            case 'f':
                context.write('\f');
                break;
            case 'n':
                context.write('\n');
                break;
            case 'r':
                context.write('\r');
                break;
            case 't':
                context.write('\t');
                break;
            case 'u':
                state = UTF16_SEQUENCE;
                break;
            default:
                throw Error::format_error(
                    line, column, "invalid escape sequence");
            }
            break;

        case UTF16_SEQUENCE:
            if (!is_hex_digit(c))
            {
                throw Error::format_error(
                    line, column, "invalid escape sequence");
            }

            utf16_seq[utf16_seq_offset++] = c;

            if (utf16_seq_offset == utf16_seq.size())
            {
                utf16_seq_offset = 0;
                state = CHARACTER;

                try
                {
                    const std::uint16_t code_unit =
                        parse_utf16_escape_sequence(utf16_seq);

                    if (high_surrogate != 0)
                    {
                        // We were waiting for the low surrogate
                        // (that now is code_unit)
                        write_utf8_char(
                            context,
                            utf32_to_utf8(
                                utf16_to_utf32(high_surrogate, code_unit)));
                        high_surrogate = 0;
                    }
                    else if (code_unit >= 0xD800 && code_unit <= 0xDBFF)
                    {
                        high_surrogate = code_unit;
                    }
                    else
                    {
                        write_utf8_char(
                            context,
                            utf32_to_utf8(utf16_to_utf32(code_unit, 0)));
                    }
                }
                catch (const encoding_error&)
                {
                    throw Error::format_error(
                        escape_line,
                        escape_column,
                        "invalid UTF-16 character");
                }
            }
            break;

        // LCOV_EXCL_START
        case CLOSED:
            break;
        // LCOV_EXCL_STOP
        }
    }

    return context.current_literal();
}

// Tells whether a raw literal obeys the JSON number grammar
inline bool is_valid_number(const std::string_view raw) noexcept
{
    enum
    {
        SIGN_OR_FIRST_DIGIT,
        FIRST_DIGIT,
        AFTER_LEADING_ZERO,
        INTEGRAL_PART,
        FRACTIONAL_PART_FIRST_DIGIT,
        FRACTIONAL_PART,
        EXPONENT_SIGN_OR_FIRST_DIGIT,
        EXPONENT_FIRST_DIGIT,
        EXPONENT,
    } state = SIGN_OR_FIRST_DIGIT;

    for (const char c : raw)
    {
        switch (state)
        {
        case SIGN_OR_FIRST_DIGIT:
            if (c == '-') // leading plus sign not allowed
            {
                state = FIRST_DIGIT;
                break;
            }
            [[fallthrough]];
        case FIRST_DIGIT:
            if (c == '0')
            {
                // If zero is the first digit, then it must be the ONLY digit
                // of the integral part
                state = AFTER_LEADING_ZERO;
                break;
            }
            if (is_digit(c))
            {
                state = INTEGRAL_PART;
                break;
            }
            return false;

        case INTEGRAL_PART:
            if (is_digit(c))
            {
                break;
            }
            [[fallthrough]];
        case AFTER_LEADING_ZERO:
            if (c == '.')
            {
                state = FRACTIONAL_PART_FIRST_DIGIT;
                break;
            }
            if (c == 'e' || c == 'E')
            {
                state = EXPONENT_SIGN_OR_FIRST_DIGIT;
                break;
            }
            return false;

        case FRACTIONAL_PART:
            if (c == 'e' || c == 'E')
            {
                state = EXPONENT_SIGN_OR_FIRST_DIGIT;
                break;
            }
            [[fallthrough]];
        case FRACTIONAL_PART_FIRST_DIGIT:
            if (is_digit(c))
            {
                state = FRACTIONAL_PART;
                break;
            }
            return false;

        case EXPONENT_SIGN_OR_FIRST_DIGIT:
            if (c == '+' || c == '-')
            {
                state = EXPONENT_FIRST_DIGIT;
                break;
            }
            [[fallthrough]];
        case EXPONENT_FIRST_DIGIT:
        case EXPONENT:
            if (is_digit(c))
            {
                state = EXPONENT;
                break;
            }
            return false;
        }
    }

    switch (state)
    {
    case AFTER_LEADING_ZERO:
    case INTEGRAL_PART:
    case FRACTIONAL_PART:
    case EXPONENT:
        return true;
    default:
        return false;
    }
}

template<typename Error>
std::string_view parse_number(buffer_context& context, const token& t)
{
    const std::size_t begin = context.read_offset();

    while (!context.at_end() && is_number_char(context.peek()))
    {
        context.read();
    }

    const std::string_view raw = context.slice(begin, context.read_offset());

    if (!is_valid_number(raw))
    {
        throw Error::format_error(t.line, t.column, "invalid number");
    }

    return raw;
}

// Consumes "true", "false" or "null"
template<typename Error>
void consume_literal(
    buffer_context& context,
    const token& t,
    const std::string_view expected)
{
    for (const char c : expected)
    {
        if (context.at_end() || context.peek() != c)
        {
            throw Error::format_error(t.line, t.column, "invalid literal");
        }
        context.read();
    }
}

} // namespace detail

// Reads the next token, skipping whitespace. Lexical errors are thrown as
// Error::format_error(). Characters that cannot start a token are returned
// as an Invalid token and left unread.
template<typename Error>
token next_token(buffer_context& context)
{
    while (!context.at_end() && detail::is_whitespace(context.peek()))
    {
        context.read();
    }

    token result;
    result.line = context.line();
    result.column = context.column();

    if (context.at_end())
    {
        result.type = token_type::EndOfInput;
        return result;
    }

    switch (context.peek())
    {
    case '{':
        context.read();
        result.type = token_type::BeginObject;
        break;
    case '}':
        context.read();
        result.type = token_type::EndObject;
        break;
    case '[':
        context.read();
        result.type = token_type::BeginArray;
        break;
    case ']':
        context.read();
        result.type = token_type::EndArray;
        break;
    case ',':
        context.read();
        result.type = token_type::Comma;
        break;
    case ':':
        context.read();
        result.type = token_type::Colon;
        break;
    case '"':
        context.read();
        result.type = token_type::String;
        result.payload = detail::parse_string<Error>(context);
        break;
    case 't':
        detail::consume_literal<Error>(context, result, "true");
        result.type = token_type::True;
        break;
    case 'f':
        detail::consume_literal<Error>(context, result, "false");
        result.type = token_type::False;
        break;
    case 'n':
        detail::consume_literal<Error>(context, result, "null");
        result.type = token_type::Null;
        break;
    default:
        if (context.peek() == '-' || detail::is_digit(context.peek()))
        {
            result.type = token_type::Number;
            result.payload = detail::parse_number<Error>(context, result);
        }
        else
        {
            result.type = token_type::Invalid;
        }
        break;
    }

    return result;
}

template<typename Error>
class seq_access;

template<typename Error>
class map_access;

template<typename Error>
class visitor;

namespace detail
{

// Whether a number literal that from_chars reported as out of range is too
// small to represent rather than too large. The literal is already valid.
inline bool underflows(const std::string_view raw) noexcept
{
    std::size_t i = (!raw.empty() && raw[0] == '-') ? 1 : 0;

    // Decimal exponent of the first significant digit, before the exponent
    // part is applied
    long long magnitude = 0;
    if (i < raw.size() && raw[i] != '0')
    {
        while (i < raw.size() && is_digit(raw[i]))
        {
            ++magnitude;
            ++i;
        }
        --magnitude;
    }
    else
    {
        ++i;
        if (i < raw.size() && raw[i] == '.')
        {
            ++i;
            magnitude = -1;
            while (i < raw.size() && raw[i] == '0')
            {
                --magnitude;
                ++i;
            }
        }
    }

    while (i < raw.size() && raw[i] != 'e' && raw[i] != 'E')
    {
        ++i;
    }

    long long exponent = 0;
    if (i < raw.size())
    {
        ++i;
        bool negative = false;
        if (i < raw.size() && (raw[i] == '-' || raw[i] == '+'))
        {
            negative = raw[i] == '-';
            ++i;
        }
        constexpr long long saturation = 1'000'000'000'000LL;
        for (; i < raw.size(); ++i)
        {
            if (exponent < saturation)
            {
                exponent = exponent * 10 + (raw[i] - '0');
            }
        }
        if (negative)
        {
            exponent = -exponent;
        }
    }

    return magnitude + exponent < 0;
}

// Decodes a number literal into a floating point type. Magnitudes too small
// to represent decode to a zero of the literal's sign.
template<typename T, typename Error>
T parse_floating(const std::string_view raw)
{
    T result {};
    const char* const end = raw.data() + raw.size();
    const auto [parse_end, error] = std::from_chars(raw.data(), end, result);
    if (parse_end == end && error == std::errc::result_out_of_range
        && underflows(raw))
    {
        return raw[0] == '-' ? -T(0) : T(0);
    }
    if (parse_end != end || error != std::errc())
    {
        throw Error::unexpected("number out of range");
    }

    return result;
}

// Decodes a raw number literal exactly once and forwards it to the narrowest
// matching visitor method: negative() for integers with a minus sign,
// nonnegative() for the other integers, floating() for everything else,
// including integers that do not fit in 64 bits
template<typename Error>
void visit_number(visitor<Error>& target, const std::string_view raw)
{
    const char* const begin = raw.data();
    const char* const end = raw.data() + raw.size();

    if (raw.find_first_of(".eE") == std::string_view::npos)
    {
        if (!raw.empty() && raw[0] == '-')
        {
            std::int64_t n = 0;
            const auto [parse_end, error] = std::from_chars(begin, end, n);
            if (parse_end == end && error == std::errc())
            {
                target.negative(n);
                return;
            }
        }
        else
        {
            std::uint64_t n = 0;
            const auto [parse_end, error] = std::from_chars(begin, end, n);
            if (parse_end == end && error == std::errc())
            {
                target.nonnegative(n);
                return;
            }
        }
    }

    target.floating(parse_floating<double, Error>(raw));
}

} // namespace detail

// Receives one JSON value. Every shape defaults to Error::unexpected(),
// so an implementation only overrides the shapes its target accepts.
template<typename Error>
class visitor
{
    static_assert(
        is_visitor_error_v<Error>,
        "typedjson::visitor<Error>: Error must provide static unexpected(), "
        "format_error() and missing_field() factories");

public:

    virtual ~visitor() = default;

    virtual void null()
    {
        throw Error::unexpected("null");
    }

    virtual void boolean(bool)
    {
        throw Error::unexpected("boolean");
    }

    virtual void string(std::string_view)
    {
        throw Error::unexpected("string");
    }

    // Receives the raw literal; override to decode it in a custom way
    virtual void number(const std::string_view raw)
    {
        detail::visit_number(*this, raw);
    }

    virtual void negative(std::int64_t)
    {
        throw Error::unexpected("negative integer");
    }

    virtual void nonnegative(std::uint64_t)
    {
        throw Error::unexpected("nonnegative integer");
    }

    virtual void floating(double)
    {
        throw Error::unexpected("floating point number");
    }

    virtual std::unique_ptr<seq_access<Error>> seq()
    {
        throw Error::unexpected("array");
    }

    virtual std::unique_ptr<map_access<Error>> map()
    {
        throw Error::unexpected("object");
    }
}; // class visitor

// Hands out the visitors for the elements of an array
template<typename Error>
class seq_access
{
public:

    virtual ~seq_access() = default;

    // The returned visitor receives the next element
    virtual visitor<Error>& element() = 0;

    // Called after the closing bracket
    virtual void finish() = 0;
}; // class seq_access

// Hands out the visitors for the values of an object
template<typename Error>
class map_access
{
public:

    virtual ~map_access() = default;

    // The returned visitor receives the value of the member named k
    virtual visitor<Error>& key(std::string_view k) = 0;

    // Called after the closing brace; the place to report missing fields
    virtual void finish() = 0;
}; // class map_access

namespace detail
{

template<typename Error>
void parse_value(
    buffer_context& context,
    visitor<Error>& target,
    const token& first,
    const parse_options& options);

template<typename Error>
[[noreturn]] void unexpected_token(const token& t, const char* expected)
{
    if (t.type == token_type::EndOfInput)
    {
        throw Error::format_error(
            t.line,
            t.column,
            std::string("unexpected end of input, expected ") + expected);
    }

    throw Error::format_error(
        t.line, t.column, std::string("expected ") + expected);
}

template<typename Error>
void enter_nested(
    buffer_context& context,
    const token& t,
    const parse_options& options)
{
    if (context.nesting_level() >= options.nesting_limit)
    {
        throw Error::format_error(
            t.line,
            t.column,
            "exceeded nesting limit (" +
                std::to_string(options.nesting_limit) + ")");
    }

    context.begin_nested();
}

template<typename Error>
void parse_array(
    buffer_context& context,
    visitor<Error>& target,
    const token& opening,
    const parse_options& options)
{
    enter_nested<Error>(context, opening, options);

    const std::unique_ptr<seq_access<Error>> seq = target.seq();

    enum
    {
        VALUE_OR_CLOSING_BRACKET, // in case the array is empty
        VALUE,
        COMMA_OR_CLOSING_BRACKET,
        END
    } state = VALUE_OR_CLOSING_BRACKET;

    while (state != END)
    {
        const token t = next_token<Error>(context);

        switch (state)
        {
        case VALUE_OR_CLOSING_BRACKET:
            if (t.type == token_type::EndArray)
            {
                state = END;
                break;
            }
            [[fallthrough]];

        case VALUE:
            parse_value(context, seq->element(), t, options);
            state = COMMA_OR_CLOSING_BRACKET;
            break;

        case COMMA_OR_CLOSING_BRACKET:
            if (t.type == token_type::Comma)
            {
                state = VALUE;
            }
            else if (t.type == token_type::EndArray)
            {
                state = END;
            }
            else
            {
                unexpected_token<Error>(t, "',' or ']'");
            }
            break;

        // LCOV_EXCL_START
        case END:
            break;
        // LCOV_EXCL_STOP
        }
    }

    seq->finish();
    context.end_nested();
}

template<typename Error>
void parse_object(
    buffer_context& context,
    visitor<Error>& target,
    const token& opening,
    const parse_options& options)
{
    enter_nested<Error>(context, opening, options);

    const std::unique_ptr<map_access<Error>> map = target.map();

    enum
    {
        FIELD_NAME_OR_CLOSING_BRACE, // in case the object is empty
        FIELD_NAME,
        COLON,
        FIELD_VALUE,
        COMMA_OR_CLOSING_BRACE,
        END
    } state = FIELD_NAME_OR_CLOSING_BRACE;

    visitor<Error>* value_target = nullptr;

    while (state != END)
    {
        const token t = next_token<Error>(context);

        switch (state)
        {
        case FIELD_NAME_OR_CLOSING_BRACE:
            if (t.type == token_type::EndObject)
            {
                state = END;
                break;
            }
            if (t.type != token_type::String)
            {
                unexpected_token<Error>(t, "string key or '}'");
            }
            [[fallthrough]];

        case FIELD_NAME:
            if (t.type != token_type::String)
            {
                unexpected_token<Error>(t, "string key");
            }
            // The key lives in the scratch buffer: hand it over before
            // reading the next token
            value_target = &map->key(t.payload);
            state = COLON;
            break;

        case COLON:
            if (t.type != token_type::Colon)
            {
                unexpected_token<Error>(t, "':'");
            }
            state = FIELD_VALUE;
            break;

        case FIELD_VALUE:
            parse_value(context, *value_target, t, options);
            state = COMMA_OR_CLOSING_BRACE;
            break;

        case COMMA_OR_CLOSING_BRACE:
            if (t.type == token_type::Comma)
            {
                state = FIELD_NAME;
            }
            else if (t.type == token_type::EndObject)
            {
                state = END;
            }
            else
            {
                unexpected_token<Error>(t, "',' or '}'");
            }
            break;

        // LCOV_EXCL_START
        case END:
            break;
        // LCOV_EXCL_STOP
        }
    }

    map->finish();
    context.end_nested();
}

template<typename Error>
void parse_value(
    buffer_context& context,
    visitor<Error>& target,
    const token& first,
    const parse_options& options)
{
    switch (first.type)
    {
    case token_type::Null:
        target.null();
        break;
    case token_type::True:
        target.boolean(true);
        break;
    case token_type::False:
        target.boolean(false);
        break;
    case token_type::Number:
        target.number(first.payload);
        break;
    case token_type::String:
        target.string(first.payload);
        break;
    case token_type::BeginArray:
        parse_array(context, target, first, options);
        break;
    case token_type::BeginObject:
        parse_object(context, target, first, options);
        break;
    default:
        unexpected_token<Error>(first, "value");
    }
}

} // namespace detail

// Feeds exactly one JSON value, and nothing else but whitespace, from the
// context into target
template<typename Error>
void parse(
    buffer_context& context,
    visitor<Error>& target,
    const parse_options& options = parse_options())
{
    const token first = next_token<Error>(context);
    detail::parse_value(context, target, first, options);

    const token last = next_token<Error>(context);
    if (last.type != token_type::EndOfInput)
    {
        throw Error::format_error(
            last.line, last.column, "trailing characters");
    }
}

// Entry point for one type: begin() binds a fresh visitor to an empty output
// slot. Specialize it for custom types, or describe structs and enums with
// struct_description / enum_description.
template<typename T, typename Error, typename Enable = void>
struct deserialize;

template<typename T, typename Error>
using visitor_for_t =
    decltype(deserialize<T, Error>::begin(std::declval<std::optional<T>&>()));

// Common base of visitors writing into an output slot
template<typename T, typename Error>
class place_base : public visitor<Error>
{
private:

    std::optional<T>* m_out;

public:

    explicit place_base(std::optional<T>& out) noexcept
    : m_out(&out)
    {
    }

protected:

    std::optional<T>& out() const noexcept
    {
        return *m_out;
    }

    template<typename... Args>
    void assign(Args&&... args)
    {
        m_out->emplace(std::forward<Args>(args)...);
    }
}; // class place_base

// The visitor of the built-in types
template<typename T, typename Error, typename Enable = void>
class place : public place_base<T, Error>
{
    static_assert(
        detail::type_dependent_false<T>,
        "typedjson::place<T>: T is not one of the supported types "
        "(bool, integers, floating point types, std::string, typedjson::value, "
        "std::optional, std::unique_ptr, std::pair, std::vector, std::map, "
        "std::unordered_map): specialize typedjson::deserialize<T, Error> "
        "or describe T with typedjson::struct_description<T> or "
        "typedjson::enum_description<T>");
}; // class place

namespace detail
{

template<typename T>
inline constexpr bool is_integer_v =
    std::is_integral_v<T> &&
    !std::is_same_v<T, bool> &&
    !std::is_same_v<T, char> &&
    !std::is_same_v<T, wchar_t> &&
    !std::is_same_v<T, char16_t> &&
    !std::is_same_v<T, char32_t>;

template<typename T>
struct is_optional : std::false_type
{
};

template<typename T>
struct is_optional<std::optional<T>> : std::true_type
{
};

template<typename T>
inline constexpr bool is_optional_v = is_optional<T>::value;

} // namespace detail

template<typename Error>
class place<bool, Error> : public place_base<bool, Error>
{
public:

    using place_base<bool, Error>::place_base;

    void boolean(const bool b) override
    {
        this->assign(b);
    }
}; // class place<bool>

template<typename T, typename Error>
class place<
    T,
    Error,
    std::enable_if_t<detail::is_integer_v<T> && std::is_signed_v<T>>>
: public place_base<T, Error>
{
public:

    using place_base<T, Error>::place_base;

    void negative(const std::int64_t n) override
    {
        if (n < std::numeric_limits<T>::min())
        {
            throw Error::unexpected("integer out of range");
        }

        this->assign(static_cast<T>(n));
    }

    void nonnegative(const std::uint64_t n) override
    {
        if (n > static_cast<std::uint64_t>(std::numeric_limits<T>::max()))
        {
            throw Error::unexpected("integer out of range");
        }

        this->assign(static_cast<T>(n));
    }
}; // class place<signed integer>

template<typename T, typename Error>
class place<
    T,
    Error,
    std::enable_if_t<detail::is_integer_v<T> && std::is_unsigned_v<T>>>
: public place_base<T, Error>
{
public:

    using place_base<T, Error>::place_base;

    // Only "-0" fits
    void negative(const std::int64_t n) override
    {
        if (n != 0)
        {
            throw Error::unexpected("integer out of range");
        }

        this->assign(static_cast<T>(0));
    }

    void nonnegative(const std::uint64_t n) override
    {
        if (n > std::numeric_limits<T>::max())
        {
            throw Error::unexpected("integer out of range");
        }

        this->assign(static_cast<T>(n));
    }
}; // class place<unsigned integer>

template<typename T, typename Error>
class place<T, Error, std::enable_if_t<std::is_floating_point_v<T>>>
: public place_base<T, Error>
{
public:

    using place_base<T, Error>::place_base;

    // Decodes directly into T, so that float and long double are not rounded
    // through double
    void number(const std::string_view raw) override
    {
        this->assign(detail::parse_floating<T, Error>(raw));
    }

    void negative(const std::int64_t n) override
    {
        this->assign(static_cast<T>(n));
    }

    void nonnegative(const std::uint64_t n) override
    {
        this->assign(static_cast<T>(n));
    }

    void floating(const double d) override
    {
        this->assign(static_cast<T>(d));
    }
}; // class place<floating point>

template<typename Error>
class place<std::string, Error> : public place_base<std::string, Error>
{
public:

    using place_base<std::string, Error>::place_base;

    void string(const std::string_view s) override
    {
        this->assign(s);
    }
}; // class place<std::string>

// null maps to an empty optional, everything else is delegated to T
template<typename T, typename Error>
class place<std::optional<T>, Error>
: public place_base<std::optional<T>, Error>
{
private:

    visitor_for_t<T, Error> inner()
    {
        this->out().emplace();

        return deserialize<T, Error>::begin(*this->out());
    }

public:

    using place_base<std::optional<T>, Error>::place_base;

    void null() override
    {
        this->assign(std::nullopt);
    }

    void boolean(const bool b) override
    {
        inner().boolean(b);
    }

    void string(const std::string_view s) override
    {
        inner().string(s);
    }

    void number(const std::string_view raw) override
    {
        inner().number(raw);
    }

    void negative(const std::int64_t n) override
    {
        inner().negative(n);
    }

    void nonnegative(const std::uint64_t n) override
    {
        inner().nonnegative(n);
    }

    void floating(const double d) override
    {
        inner().floating(d);
    }

    std::unique_ptr<seq_access<Error>> seq() override
    {
        return inner().seq();
    }

    std::unique_ptr<map_access<Error>> map() override
    {
        return inner().map();
    }
}; // class place<std::optional<T>>

namespace detail
{

template<typename T, typename Error>
class boxed_seq final : public seq_access<Error>
{
private:

    std::optional<std::unique_ptr<T>>& m_out;
    std::optional<T> m_value;
    std::unique_ptr<seq_access<Error>> m_inner;

public:

    explicit boxed_seq(std::optional<std::unique_ptr<T>>& out)
    : m_out(out)
    , m_inner(deserialize<T, Error>::begin(m_value).seq())
    {
    }

    visitor<Error>& element() override
    {
        return m_inner->element();
    }

    void finish() override
    {
        m_inner->finish();

        if (m_value)
        {
            m_out.emplace(std::make_unique<T>(std::move(*m_value)));
        }
    }
}; // class boxed_seq

template<typename T, typename Error>
class boxed_map final : public map_access<Error>
{
private:

    std::optional<std::unique_ptr<T>>& m_out;
    std::optional<T> m_value;
    std::unique_ptr<map_access<Error>> m_inner;

public:

    explicit boxed_map(std::optional<std::unique_ptr<T>>& out)
    : m_out(out)
    , m_inner(deserialize<T, Error>::begin(m_value).map())
    {
    }

    visitor<Error>& key(const std::string_view k) override
    {
        return m_inner->key(k);
    }

    void finish() override
    {
        m_inner->finish();

        if (m_value)
        {
            m_out.emplace(std::make_unique<T>(std::move(*m_value)));
        }
    }
}; // class boxed_map

} // namespace detail

template<typename T, typename Error>
class place<std::unique_ptr<T>, Error>
: public place_base<std::unique_ptr<T>, Error>
{
private:

    template<typename Visit>
    void forward(Visit&& visit)
    {
        std::optional<T> value;
        {
            auto target = deserialize<T, Error>::begin(value);
            visit(target);
        }

        if (value)
        {
            this->assign(std::make_unique<T>(std::move(*value)));
        }
    }

public:

    using place_base<std::unique_ptr<T>, Error>::place_base;

    void null() override
    {
        forward([](auto& target) {target.null();});
    }

    void boolean(const bool b) override
    {
        forward([b](auto& target) {target.boolean(b);});
    }

    void string(const std::string_view s) override
    {
        forward([s](auto& target) {target.string(s);});
    }

    void number(const std::string_view raw) override
    {
        forward([raw](auto& target) {target.number(raw);});
    }

    void negative(const std::int64_t n) override
    {
        forward([n](auto& target) {target.negative(n);});
    }

    void nonnegative(const std::uint64_t n) override
    {
        forward([n](auto& target) {target.nonnegative(n);});
    }

    void floating(const double d) override
    {
        forward([d](auto& target) {target.floating(d);});
    }

    std::unique_ptr<seq_access<Error>> seq() override
    {
        return std::make_unique<detail::boxed_seq<T, Error>>(this->out());
    }

    std::unique_ptr<map_access<Error>> map() override
    {
        return std::make_unique<detail::boxed_map<T, Error>>(this->out());
    }
}; // class place<std::unique_ptr<T>>

namespace detail
{

template<typename T, typename Error>
class vector_builder final : public seq_access<Error>
{
private:

    std::optional<std::vector<T>>& m_out;
    std::vector<T> m_vector;
    std::optional<T> m_element;
    visitor_for_t<T, Error> m_element_target;

    void shift()
    {
        if (m_element)
        {
            m_vector.push_back(std::move(*m_element));
            m_element.reset();
        }
    }

public:

    explicit vector_builder(std::optional<std::vector<T>>& out)
    : m_out(out)
    , m_element_target(deserialize<T, Error>::begin(m_element))
    {
    }

    visitor<Error>& element() override
    {
        shift();
        return m_element_target;
    }

    void finish() override
    {
        shift();
        m_out.emplace(std::move(m_vector));
    }
}; // class vector_builder

template<typename A, typename B, typename Error>
class pair_builder final : public seq_access<Error>
{
private:

    std::optional<std::pair<A, B>>& m_out;
    std::optional<A> m_first;
    std::optional<B> m_second;
    visitor_for_t<A, Error> m_first_target;
    visitor_for_t<B, Error> m_second_target;
    std::size_t m_elements = 0;

public:

    explicit pair_builder(std::optional<std::pair<A, B>>& out)
    : m_out(out)
    , m_first_target(deserialize<A, Error>::begin(m_first))
    , m_second_target(deserialize<B, Error>::begin(m_second))
    {
    }

    visitor<Error>& element() override
    {
        switch (m_elements++)
        {
        case 0:
            return m_first_target;
        case 1:
            return m_second_target;
        default:
            throw Error::unexpected("pair has more than 2 elements");
        }
    }

    void finish() override
    {
        if (!m_first || !m_second)
        {
            throw Error::unexpected("pair should have 2 elements");
        }

        m_out.emplace(std::move(*m_first), std::move(*m_second));
    }
}; // class pair_builder

// Map keys are either strings or integers spelled as strings
template<typename Key, typename Error>
Key parse_map_key(const std::string_view k)
{
    if constexpr (std::is_same_v<Key, std::string>)
    {
        return Key(k);
    }
    else if constexpr (is_integer_v<Key>)
    {
        Key result {};
        const char* const end = k.data() + k.size();
        const auto [parse_end, error] = std::from_chars(k.data(), end, result);
        if (k.empty() || parse_end != end || error != std::errc())
        {
            throw Error::unexpected(
                "can not parse map key `" + std::string(k) + "`");
        }
        return result;
    }
    else // if constexpr
    {
        static_assert(
            type_dependent_false<Key>,
            "typedjson: map keys must be std::string or integers");
    }
}

template<typename Map, typename Error>
class map_builder final : public map_access<Error>
{
private:

    using key_type = typename Map::key_type;
    using mapped_type = typename Map::mapped_type;

    std::optional<Map>& m_out;
    Map m_map;
    std::optional<key_type> m_key;
    std::optional<mapped_type> m_value;
    visitor_for_t<mapped_type, Error> m_value_target;

    // Duplicate keys: the last value wins
    void shift()
    {
        if (m_key && m_value)
        {
            m_map.insert_or_assign(std::move(*m_key), std::move(*m_value));
        }

        m_key.reset();
        m_value.reset();
    }

public:

    explicit map_builder(std::optional<Map>& out)
    : m_out(out)
    , m_value_target(deserialize<mapped_type, Error>::begin(m_value))
    {
    }

    visitor<Error>& key(const std::string_view k) override
    {
        shift();
        m_key.emplace(parse_map_key<key_type, Error>(k));

        return m_value_target;
    }

    void finish() override
    {
        shift();
        m_out.emplace(std::move(m_map));
    }
}; // class map_builder

} // namespace detail

template<typename T, typename Allocator, typename Error>
class place<std::vector<T, Allocator>, Error>
: public place_base<std::vector<T, Allocator>, Error>
{
    static_assert(
        std::is_same_v<Allocator, std::allocator<T>>,
        "typedjson: only std::vector with the default allocator is supported");

public:

    using place_base<std::vector<T, Allocator>, Error>::place_base;

    std::unique_ptr<seq_access<Error>> seq() override
    {
        return std::make_unique<detail::vector_builder<T, Error>>(this->out());
    }
}; // class place<std::vector<T>>

template<typename A, typename B, typename Error>
class place<std::pair<A, B>, Error> : public place_base<std::pair<A, B>, Error>
{
public:

    using place_base<std::pair<A, B>, Error>::place_base;

    std::unique_ptr<seq_access<Error>> seq() override
    {
        return std::make_unique<detail::pair_builder<A, B, Error>>(
            this->out());
    }
}; // class place<std::pair<A, B>>

template<
    typename Key,
    typename T,
    typename Compare,
    typename Allocator,
    typename Error>
class place<std::map<Key, T, Compare, Allocator>, Error>
: public place_base<std::map<Key, T, Compare, Allocator>, Error>
{
    using map_type = std::map<Key, T, Compare, Allocator>;

public:

    using place_base<map_type, Error>::place_base;

    std::unique_ptr<map_access<Error>> map() override
    {
        return std::make_unique<detail::map_builder<map_type, Error>>(
            this->out());
    }
}; // class place<std::map<Key, T>>

template<
    typename Key,
    typename T,
    typename Hash,
    typename KeyEqual,
    typename Allocator,
    typename Error>
class place<std::unordered_map<Key, T, Hash, KeyEqual, Allocator>, Error>
: public place_base<std::unordered_map<Key, T, Hash, KeyEqual, Allocator>, Error>
{
    using map_type = std::unordered_map<Key, T, Hash, KeyEqual, Allocator>;

public:

    using place_base<map_type, Error>::place_base;

    std::unique_ptr<map_access<Error>> map() override
    {
        return std::make_unique<detail::map_builder<map_type, Error>>(
            this->out());
    }
}; // class place<std::unordered_map<Key, T>>

namespace detail
{

// Accepts and discards any value
template<typename Error>
class ignore final
: public visitor<Error>
, public seq_access<Error>
, public map_access<Error>
{
public:

    void null() override
    {
    }

    void boolean(bool) override
    {
    }

    void string(std::string_view) override
    {
    }

    void number(std::string_view) override
    {
    }

    void negative(std::int64_t) override
    {
    }

    void nonnegative(std::uint64_t) override
    {
    }

    void floating(double) override
    {
    }

    std::unique_ptr<seq_access<Error>> seq() override
    {
        return std::make_unique<ignore>();
    }

    std::unique_ptr<map_access<Error>> map() override
    {
        return std::make_unique<ignore>();
    }

    visitor<Error>& element() override
    {
        return *this;
    }

    visitor<Error>& key(std::string_view) override
    {
        return *this;
    }

    void finish() override
    {
    }
}; // class ignore

} // namespace detail

enum value_type
{
    String,
    Number,
    Boolean,
    Object,
    Array,
    Null
};

class bad_value_cast : public std::invalid_argument
{
public:

    using std::invalid_argument::invalid_argument;
};

// Any JSON value
class value final
{
public:

    using array_type = std::vector<value>;

    // Keys are unique and keep their first position
    using object_type = std::vector<std::pair<std::string, value>>;

private:

    std::variant<
        std::nullptr_t,
        bool,
        std::uint64_t,
        std::int64_t,
        double,
        std::string,
        array_type,
        object_type> m_data;

public:

    value() noexcept = default;

    explicit value(const bool b) noexcept
    : m_data(b)
    {
    }

    explicit value(const std::uint64_t n) noexcept
    : m_data(n)
    {
    }

    explicit value(const std::int64_t n) noexcept
    : m_data(n)
    {
    }

    explicit value(const double d) noexcept
    : m_data(d)
    {
    }

    explicit value(std::string s) noexcept
    : m_data(std::move(s))
    {
    }

    explicit value(array_type array) noexcept
    : m_data(std::move(array))
    {
    }

    explicit value(object_type object) noexcept
    : m_data(std::move(object))
    {
    }

    value_type type() const noexcept
    {
        switch (m_data.index())
        {
        case 1:
            return Boolean;
        case 2:
        case 3:
        case 4:
            return Number;
        case 5:
            return String;
        case 6:
            return Array;
        case 7:
            return Object;
        default:
            return Null;
        }
    }

    bool is_null() const noexcept
    {
        return type() == Null;
    }

    template<typename T>
    T as() const
    {
        if (type() == Null)
        {
            throw bad_value_cast(
                "cannot call value::as<T>() on values of type Null: "
                "consider checking value::type() first");
        }

        if (type() == Object || type() == Array)
        {
            throw bad_value_cast(
                "cannot call value::as<T>() on values of type Object or "
                "Array: use as_object() or as_array()");
        }

        if constexpr (std::is_same_v<T, std::string>
            || std::is_same_v<T, std::string_view>)
        {
            if (type() != String)
            {
                throw bad_value_cast("value::as<T>(): value type is not String");
            }

            return T(std::get<std::string>(m_data));
        }
        else if constexpr (std::is_same_v<T, bool>)
        {
            if (type() != Boolean)
            {
                throw bad_value_cast(
                    "value::as<T>(): value type is not Boolean");
            }

            return std::get<bool>(m_data);
        }
        else if constexpr (std::is_arithmetic_v<T>)
        {
            if (type() != Number)
            {
                throw bad_value_cast("value::as<T>(): value type is not Number");
            }

            return std::visit(
                [](const auto n) -> T
                {
                    using number_type = std::decay_t<decltype(n)>;
                    if constexpr (!std::is_arithmetic_v<number_type>
                        || std::is_same_v<number_type, bool>)
                    {
                        // Not a number alternative, excluded by type() above
                        throw std::range_error( // LCOV_EXCL_LINE
                            "value::as<T>() could not convert the number");
                    }
                    else if constexpr (std::is_floating_point_v<T>)
                    {
                        return static_cast<T>(n);
                    }
                    else if constexpr (std::is_floating_point_v<number_type>)
                    {
                        throw std::range_error(
                            "value::as<T>() could not convert the number");
                    }
                    else // if constexpr
                    {
                        if (!in_range<T>(n))
                        {
                            throw std::range_error(
                                "value::as<T>() could not convert the number");
                        }
                        return static_cast<T>(n);
                    }
                },
                m_data);
        }
        else // if constexpr
        {
            static_assert(
                detail::type_dependent_false<T>,
                "value::as<T>(): T is not one of the supported types "
                "(std::string, std::string_view, bool, arithmetic types)");
        }
    }

    const array_type& as_array() const
    {
        if (type() != Array)
        {
            throw bad_value_cast("value::as_array(): value type is not Array");
        }

        return std::get<array_type>(m_data);
    }

    const object_type& as_object() const
    {
        if (type() != Object)
        {
            throw bad_value_cast(
                "value::as_object(): value type is not Object");
        }

        return std::get<object_type>(m_data);
    }

    // Returns nullptr if this is not an Object or has no such member
    const value* find(const std::string_view key) const noexcept
    {
        if (type() != Object)
        {
            return nullptr;
        }

        for (const auto& [name, member] : std::get<object_type>(m_data))
        {
            if (name == key)
            {
                return &member;
            }
        }

        return nullptr;
    }

    // Number of elements or members, 0 for scalars
    std::size_t size() const noexcept
    {
        switch (type())
        {
        case Array:
            return std::get<array_type>(m_data).size();
        case Object:
            return std::get<object_type>(m_data).size();
        default:
            return 0;
        }
    }

    // Feeds this value to target the way parse() would feed its source text.
    // Numbers reach target through negative(), nonnegative() or floating().
    template<typename Error>
    void accept(visitor<Error>& target) const
    {
        std::visit(
            [&target](const auto& data)
            {
                using data_type = std::decay_t<decltype(data)>;
                if constexpr (std::is_same_v<data_type, std::nullptr_t>)
                {
                    target.null();
                }
                else if constexpr (std::is_same_v<data_type, bool>)
                {
                    target.boolean(data);
                }
                else if constexpr (std::is_same_v<data_type, std::uint64_t>)
                {
                    target.nonnegative(data);
                }
                else if constexpr (std::is_same_v<data_type, std::int64_t>)
                {
                    target.negative(data);
                }
                else if constexpr (std::is_same_v<data_type, double>)
                {
                    target.floating(data);
                }
                else if constexpr (std::is_same_v<data_type, std::string>)
                {
                    target.string(data);
                }
                else if constexpr (std::is_same_v<data_type, array_type>)
                {
                    const auto access = target.seq();
                    for (const auto& element : data)
                    {
                        element.accept(access->element());
                    }
                    access->finish();
                }
                else // if constexpr
                {
                    const auto access = target.map();
                    for (const auto& [key, member] : data)
                    {
                        member.accept(access->key(key));
                    }
                    access->finish();
                }
            },
            m_data);
    }

    friend bool operator==(const value& lhs, const value& rhs)
    {
        return lhs.m_data == rhs.m_data;
    }

    friend bool operator!=(const value& lhs, const value& rhs)
    {
        return !(lhs == rhs);
    }

private:

    template<typename T, typename N>
    static bool in_range(const N n) noexcept
    {
        if constexpr (std::is_signed_v<N>)
        {
            if constexpr (std::is_signed_v<T>)
            {
                return n >= std::numeric_limits<T>::min() &&
                    n <= std::numeric_limits<T>::max();
            }
            else
            {
                return n >= 0 &&
                    static_cast<std::uint64_t>(n) <=
                        std::numeric_limits<T>::max();
            }
        }
        else
        {
            return n <= static_cast<std::uint64_t>(
                std::numeric_limits<T>::max());
        }
    }
}; // class value

namespace detail
{

template<typename Error>
class array_builder final : public seq_access<Error>
{
private:

    std::optional<value>& m_out;
    value::array_type m_array;
    std::optional<value> m_element;
    visitor_for_t<value, Error> m_element_target;

    void shift()
    {
        if (m_element)
        {
            m_array.push_back(std::move(*m_element));
            m_element.reset();
        }
    }

public:

    explicit array_builder(std::optional<value>& out)
    : m_out(out)
    , m_element_target(deserialize<value, Error>::begin(m_element))
    {
    }

    visitor<Error>& element() override
    {
        shift();
        return m_element_target;
    }

    void finish() override
    {
        shift();
        m_out.emplace(std::move(m_array));
    }
}; // class array_builder

template<typename Error>
class object_builder final : public map_access<Error>
{
private:

    std::optional<value>& m_out;
    value::object_type m_object;
    std::string m_key;
    std::optional<value> m_value;
    visitor_for_t<value, Error> m_value_target;

    void shift()
    {
        if (!m_value)
        {
            return;
        }

        for (auto& member : m_object)
        {
            if (member.first == m_key)
            {
                member.second = std::move(*m_value);
                m_value.reset();
                return;
            }
        }

        m_object.emplace_back(std::move(m_key), std::move(*m_value));
        m_value.reset();
    }

public:

    explicit object_builder(std::optional<value>& out)
    : m_out(out)
    , m_value_target(deserialize<value, Error>::begin(m_value))
    {
    }

    visitor<Error>& key(const std::string_view k) override
    {
        shift();
        m_key.assign(k.data(), k.size());

        return m_value_target;
    }

    void finish() override
    {
        shift();
        m_out.emplace(std::move(m_object));
    }
}; // class object_builder

} // namespace detail

template<typename Error>
class place<value, Error> : public place_base<value, Error>
{
public:

    using place_base<value, Error>::place_base;

    void null() override
    {
        this->assign();
    }

    void boolean(const bool b) override
    {
        this->assign(b);
    }

    void string(const std::string_view s) override
    {
        this->assign(std::string(s));
    }

    void negative(const std::int64_t n) override
    {
        this->assign(n);
    }

    void nonnegative(const std::uint64_t n) override
    {
        this->assign(n);
    }

    void floating(const double d) override
    {
        this->assign(d);
    }

    std::unique_ptr<seq_access<Error>> seq() override
    {
        return std::make_unique<detail::array_builder<Error>>(this->out());
    }

    std::unique_ptr<map_access<Error>> map() override
    {
        return std::make_unique<detail::object_builder<Error>>(this->out());
    }
}; // class place<value>

// Naming conventions applied to field names to obtain JSON keys.
// Field names are expected in snake_case.
enum class rename_rule
{
    none,                 // user_name
    lower_case,           // username
    camel_case,           // userName
    pascal_case,          // UserName
    kebab_case,           // user-name
    screaming_snake_case, // USER_NAME
};

namespace detail
{

inline char to_upper(const char c) noexcept
{
    return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
}

inline char to_lower(const char c) noexcept
{
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

inline std::string apply_rename_rule(
    const rename_rule rule,
    const std::string_view name)
{
    std::string result;
    result.reserve(name.size());

    bool capitalize_next = rule == rename_rule::pascal_case;

    for (const char c : name)
    {
        switch (rule)
        {
        case rename_rule::none:
            result.push_back(c);
            break;

        case rename_rule::lower_case:
            if (c != '_')
            {
                result.push_back(to_lower(c));
            }
            break;

        case rename_rule::camel_case:
        case rename_rule::pascal_case:
            if (c == '_')
            {
                capitalize_next = true;
            }
            else if (capitalize_next)
            {
                result.push_back(to_upper(c));
                capitalize_next = false;
            }
            else
            {
                result.push_back(c);
            }
            break;

        case rename_rule::kebab_case:
            result.push_back(c == '_' ? '-' : c);
            break;

        case rename_rule::screaming_snake_case:
            result.push_back(to_upper(c));
            break;
        }
    }

    return result;
}

struct no_default
{
};

struct value_initialized_default
{
};

struct no_missing_field_error
{
};

} // namespace detail

// Describes one field of a struct: its literal name, the member it is
// written to, an optional key override, an optional default and an optional
// factory of the error thrown when the field is missing
template<
    typename T,
    typename M,
    typename Default = detail::no_default,
    typename MissingError = detail::no_missing_field_error>
class field_description
{
private:

    std::string_view m_name;
    M T::* m_member;
    std::string_view m_rename;
    Default m_default;
    MissingError m_missing_error;

public:

    using struct_type = T;
    using member_type = M;

    static constexpr bool has_default =
        !std::is_same_v<Default, detail::no_default>;

    static constexpr bool has_missing_field_error =
        !std::is_same_v<MissingError, detail::no_missing_field_error>;

    field_description(
        const std::string_view name,
        M T::* const member,
        const std::string_view rename,
        Default make_default,
        MissingError make_missing_error)
    : m_name(name)
    , m_member(member)
    , m_rename(rename)
    , m_default(std::move(make_default))
    , m_missing_error(std::move(make_missing_error))
    {
    }

    // Takes precedence over the rename_all rule of the struct
    field_description rename(const std::string_view key) const
    {
        return field_description(
            m_name, m_member, key, m_default, m_missing_error);
    }

    // A missing field is value-initialized
    field_description<T, M, detail::value_initialized_default, MissingError>
    with_default() const
    {
        return {m_name, m_member, m_rename, {}, m_missing_error};
    }

    // A missing field is set to make_default()
    template<typename F>
    field_description<T, M, F, MissingError> with_default(F make_default) const
    {
        return {
            m_name, m_member, m_rename, std::move(make_default), m_missing_error};
    }

    // A missing field throws make_error() instead of Error::missing_field().
    // Fields with a default, and optional fields, are never missing.
    template<typename F>
    field_description<T, M, Default, F> missing_field_error(F make_error) const
    {
        return {m_name, m_member, m_rename, m_default, std::move(make_error)};
    }

    std::string_view name() const noexcept
    {
        return m_name;
    }

    std::string_view rename_override() const noexcept
    {
        return m_rename;
    }

    M T::* member() const noexcept
    {
        return m_member;
    }

    M make_default() const
    {
        if constexpr (std::is_same_v<Default, detail::value_initialized_default>)
        {
            return M();
        }
        else
        {
            return m_default();
        }
    }

    auto make_missing_field_error() const
    {
        return m_missing_error();
    }
}; // class field_description

template<typename T, typename M>
field_description<T, M> field(const std::string_view name, M T::* const member)
{
    return {name, member, {}, {}, {}};
}

// Specialize with a static fields() returning a std::tuple of field(...)
// descriptors to make T deserializable from a JSON object.
// T must be default constructible.
template<typename T, typename Enable = void>
struct struct_description;

// Specialize with a static values() returning an array of
// std::pair<std::string_view, E> to make E deserializable from a JSON string
template<typename E, typename Enable = void>
struct enum_description;

// Specialize for a std::variant V to make it deserializable from an
// internally tagged JSON object: the member named by a static tag holds the
// name of the alternative, the other members are given to that alternative.
// A static names() returns one name per alternative, in order.
template<typename V, typename Enable = void>
struct tagged_description;

struct struct_options_base
{
    static constexpr rename_rule rename_all = rename_rule::none;

    // Strict mode: unknown keys are an error instead of being skipped
    static constexpr bool deny_unknown_fields = false;

    // Error type used by from_string<T>() when none is given
    using error_type = error;
};

// Specialize inheriting from struct_options_base and shadow what differs.
// A specialization may also declare
//
//     static Error unknown_field_error(
//         std::string_view key,
//         const std::vector<std::string_view>& accepted);
//
// which implies strict mode and builds the error thrown for an unknown key.
template<typename T, typename Enable = void>
struct struct_options : struct_options_base
{
};

template<typename T>
using default_error_t = typename struct_options<T>::error_type;

namespace detail
{

template<typename T, typename = void>
struct has_struct_description : std::false_type
{
};

template<typename T>
struct has_struct_description<
    T,
    std::void_t<decltype(struct_description<T>::fields())>>
: std::true_type
{
};

template<typename T>
inline constexpr bool has_struct_description_v =
    has_struct_description<T>::value;

template<typename T, typename = void>
struct has_enum_description : std::false_type
{
};

template<typename T>
struct has_enum_description<
    T,
    std::void_t<decltype(enum_description<T>::values())>>
: std::true_type
{
};

template<typename T>
inline constexpr bool has_enum_description_v = has_enum_description<T>::value;

template<typename T, typename = void>
struct has_tagged_description : std::false_type
{
};

template<typename T>
struct has_tagged_description<
    T,
    std::void_t<
        decltype(tagged_description<T>::tag),
        decltype(tagged_description<T>::names())>>
: std::true_type
{
};

template<typename T>
inline constexpr bool has_tagged_description_v =
    has_tagged_description<T>::value;

template<typename T, typename = void>
struct has_unknown_field_error : std::false_type
{
};

template<typename T>
struct has_unknown_field_error<
    T,
    std::void_t<decltype(struct_options<T>::unknown_field_error(
        std::string_view(),
        std::declval<const std::vector<std::string_view>&>()))>>
: std::true_type
{
};

template<typename T>
inline constexpr bool has_unknown_field_error_v =
    has_unknown_field_error<T>::value;

template<typename Fields>
struct field_slots;

template<typename... Fields>
struct field_slots<std::tuple<Fields...>>
{
    using type = std::tuple<std::optional<typename Fields::member_type>...>;
};

template<typename Fields, typename Error>
struct field_targets;

template<typename... Fields, typename Error>
struct field_targets<std::tuple<Fields...>, Error>
{
    using type = std::tuple<visitor_for_t<typename Fields::member_type, Error>...>;
};

template<typename T, typename Error>
class struct_builder final : public map_access<Error>
{
private:

    using fields_type = decltype(struct_description<T>::fields());
    using slots_type = typename field_slots<fields_type>::type;
    using targets_type = typename field_targets<fields_type, Error>::type;

    static constexpr std::size_t n_fields = std::tuple_size_v<fields_type>;

    std::optional<T>& m_out;
    slots_type m_slots;
    targets_type m_targets;
    std::array<visitor<Error>*, n_fields> m_targets_by_index;
    ignore<Error> m_ignore;

    static const fields_type& fields()
    {
        static const fields_type fields = struct_description<T>::fields();
        return fields;
    }

    template<std::size_t... I>
    static std::array<std::string, n_fields> make_keys(std::index_sequence<I...>)
    {
        return {{effective_key(std::get<I>(fields()))...}};
    }

    template<typename Field>
    static std::string effective_key(const Field& f)
    {
        if (!f.rename_override().empty())
        {
            return std::string(f.rename_override());
        }

        return apply_rename_rule(struct_options<T>::rename_all, f.name());
    }

    // JSON keys of the fields, in declaration order
    static const std::array<std::string, n_fields>& keys()
    {
        static const std::array<std::string, n_fields> keys =
            make_keys(std::make_index_sequence<n_fields>());
        return keys;
    }

    template<std::size_t... I>
    targets_type make_targets(std::index_sequence<I...>)
    {
        return targets_type(
            deserialize<
                typename std::tuple_element_t<I, fields_type>::member_type,
                Error>::begin(std::get<I>(m_slots))...);
    }

    template<std::size_t... I>
    void index_targets(std::index_sequence<I...>)
    {
        m_targets_by_index = {{
            static_cast<visitor<Error>*>(&std::get<I>(m_targets))...}};
    }

    template<std::size_t I>
    void fill_field(T& result)
    {
        const auto& f = std::get<I>(fields());
        auto& slot = std::get<I>(m_slots);

        using field_type = std::decay_t<decltype(f)>;
        using member_type = typename field_type::member_type;

        if (slot)
        {
            result.*f.member() = std::move(*slot);
        }
        else if constexpr (field_type::has_default)
        {
            result.*f.member() = f.make_default();
        }
        else if constexpr (is_optional_v<member_type>)
        {
            result.*f.member() = std::nullopt;
        }
        else if constexpr (field_type::has_missing_field_error)
        {
            throw static_cast<Error>(f.make_missing_field_error());
        }
        else
        {
            throw Error::missing_field(keys()[I]);
        }
    }

    template<std::size_t... I>
    void fill(T& result, std::index_sequence<I...>)
    {
        (fill_field<I>(result), ...);
    }

public:

    explicit struct_builder(std::optional<T>& out)
    : m_out(out)
    , m_targets(make_targets(std::make_index_sequence<n_fields>()))
    {
        index_targets(std::make_index_sequence<n_fields>());
    }

    struct_builder(const struct_builder&) = delete;
    struct_builder& operator=(const struct_builder&) = delete;

    visitor<Error>& key(const std::string_view k) override
    {
        const auto& field_keys = keys();

        for (std::size_t i = 0; i < n_fields; ++i)
        {
            if (field_keys[i] == k)
            {
                return *m_targets_by_index[i];
            }
        }

        if constexpr (has_unknown_field_error_v<T>)
        {
            const std::vector<std::string_view> accepted(
                field_keys.begin(), field_keys.end());
            throw static_cast<Error>(
                struct_options<T>::unknown_field_error(k, accepted));
        }
        else if constexpr (struct_options<T>::deny_unknown_fields)
        {
            throw Error::unexpected(
                "unknown field `" + std::string(k) + "`");
        }

        return m_ignore;
    }

    void finish() override
    {
        T result {};
        fill(result, std::make_index_sequence<n_fields>());
        m_out.emplace(std::move(result));
    }
}; // class struct_builder

} // namespace detail

// Visitor of the types described by struct_description: accepts objects only
template<typename T, typename Error>
class struct_visitor : public place_base<T, Error>
{
public:

    using place_base<T, Error>::place_base;

    std::unique_ptr<map_access<Error>> map() override
    {
        return std::make_unique<detail::struct_builder<T, Error>>(this->out());
    }
}; // class struct_visitor

// Visitor of the types described by enum_description: accepts strings only
template<typename E, typename Error>
class enum_visitor : public place_base<E, Error>
{
public:

    using place_base<E, Error>::place_base;

    void string(const std::string_view s) override
    {
        for (const auto& [name, enumerator] : enum_description<E>::values())
        {
            if (name == s)
            {
                this->assign(enumerator);
                return;
            }
        }

        throw Error::unexpected("unknown variant `" + std::string(s) + "`");
    }
}; // class enum_visitor

namespace detail
{

// Collects the members of a tagged object, then hands the ones other than
// the tag to the alternative the tag names
template<typename V, typename Error>
class tagged_builder final : public map_access<Error>
{
private:

    static constexpr std::size_t n_alternatives = std::variant_size_v<V>;

    static_assert(
        std::tuple_size_v<decltype(tagged_description<V>::names())>
            == n_alternatives,
        "typedjson::tagged_description<V>::names() must name every "
        "alternative of V");

    std::optional<V>& m_out;
    std::optional<value> m_object;
    object_builder<Error> m_members;

    template<std::size_t I>
    void build_alternative()
    {
        using alternative = std::variant_alternative_t<I, V>;

        std::optional<alternative> result;
        {
            auto target = deserialize<alternative, Error>::begin(result);
            const auto access = target.map();
            for (const auto& [key, member] : m_object->as_object())
            {
                if (key != tagged_description<V>::tag)
                {
                    member.accept(access->key(key));
                }
            }
            access->finish();
        }

        if (result)
        {
            m_out.emplace(std::in_place_index<I>, std::move(*result));
        }
    }

    template<std::size_t... I>
    void build(const std::size_t index, std::index_sequence<I...>)
    {
        ((index == I ? build_alternative<I>() : void()), ...);
    }

public:

    explicit tagged_builder(std::optional<V>& out)
    : m_out(out)
    , m_members(m_object)
    {
    }

    tagged_builder(const tagged_builder&) = delete;
    tagged_builder& operator=(const tagged_builder&) = delete;

    visitor<Error>& key(const std::string_view k) override
    {
        return m_members.key(k);
    }

    void finish() override
    {
        m_members.finish();

        const std::string_view tag = tagged_description<V>::tag;
        const value* const tag_value = m_object->find(tag);
        if (tag_value == nullptr)
        {
            throw Error::missing_field(tag);
        }

        std::optional<std::string> name;
        {
            auto target = deserialize<std::string, Error>::begin(name);
            tag_value->accept(target);
        }

        const auto names = tagged_description<V>::names();
        for (std::size_t i = 0; i < n_alternatives; ++i)
        {
            if (names[i] == *name)
            {
                build(i, std::make_index_sequence<n_alternatives>());
                return;
            }
        }

        throw Error::unexpected("unknown variant `" + *name + "`");
    }
}; // class tagged_builder

} // namespace detail

// Visitor of the types described by tagged_description: accepts objects only
template<typename V, typename Error>
class tagged_visitor : public place_base<V, Error>
{
public:

    using place_base<V, Error>::place_base;

    std::unique_ptr<map_access<Error>> map() override
    {
        return std::make_unique<detail::tagged_builder<V, Error>>(this->out());
    }
}; // class tagged_visitor

template<typename T, typename Error, typename Enable>
struct deserialize
{
    static place<T, Error> begin(std::optional<T>& out)
    {
        return place<T, Error>(out);
    }
};

template<typename T, typename Error>
struct deserialize<
    T,
    Error,
    std::enable_if_t<detail::has_struct_description_v<T>>>
{
    static struct_visitor<T, Error> begin(std::optional<T>& out)
    {
        return struct_visitor<T, Error>(out);
    }
};

template<typename T, typename Error>
struct deserialize<
    T,
    Error,
    std::enable_if_t<detail::has_enum_description_v<T>>>
{
    static enum_visitor<T, Error> begin(std::optional<T>& out)
    {
        return enum_visitor<T, Error>(out);
    }
};

template<typename V, typename Error>
struct deserialize<
    V,
    Error,
    std::enable_if_t<detail::has_tagged_description_v<V>>>
{
    static tagged_visitor<V, Error> begin(std::optional<V>& out)
    {
        return tagged_visitor<V, Error>(out);
    }
};

// Parses json into a T. Errors are thrown as Error values.
template<typename T, typename Error = default_error_t<T>>
T from_string(
    const std::string_view json,
    const parse_options& options = parse_options())
{
    static_assert(
        is_visitor_error_v<Error>,
        "typedjson::from_string<T, Error>: Error must provide static "
        "unexpected(), format_error() and missing_field() factories");

    std::optional<T> out;
    {
        auto root = deserialize<T, Error>::begin(out);
        buffer_context context(json);
        parse<Error>(context, root, options);
    }

    if (!out)
    {
        // Only a custom visitor that does not assign can get here
        throw Error::unexpected("no value was produced");
    }

    return std::move(*out);
}

// Same as above, but writes into an output slot, only on success
template<typename T, typename Error = default_error_t<T>>
void from_string(
    const std::string_view json,
    std::optional<T>& out,
    const parse_options& options = parse_options())
{
    out.emplace(from_string<T, Error>(json, options));
}

} // namespace typedjson

#endif // TYPEDJSON_H

#include <cctype>
#include <fstream>
#include <gigmap/command_line.hpp>
#include <gigmap/error.hpp>
#include <gigmap/logger.hpp>
#include <sstream>
#include <string_view>

namespace gigmap
{

// ─── JSON parameters ────────────────────────────────────────────────────────

namespace
{

void append_utf8(std::string& out, unsigned cp)
{
    if (cp < 0x80)
    {
        out += static_cast<char>(cp);
    }
    else if (cp < 0x800)
    {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    else
    {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

// Reads one JSON object whose values are all scalars.
class FlatJsonReader
{
   public:
    FlatJsonReader(const std::string& text, const std::string& source) : text_(text), source_(source)
    {
    }

    RawParams read()
    {
        RawParams out;
        skip_ws();
        expect('{');
        skip_ws();
        if (peek() == '}')
        {
            ++pos_;
            finish();
            return out;
        }
        while (true)
        {
            skip_ws();
            std::string key = read_string();
            skip_ws();
            expect(':');
            skip_ws();
            auto value = read_value(key);
            if (value)
                out[key] = *value;
            skip_ws();
            char c = next();
            if (c == '}')
                break;
            if (c != ',')
                fail("expected ',' or '}'");
        }
        finish();
        return out;
    }

   private:
    [[noreturn]] void fail(const std::string& what) const
    {
        throw ConfigError(source_ + ": invalid parameters JSON at offset " + std::to_string(pos_)
                          + ": " + what);
    }

    char peek() const { return pos_ < text_.size() ? text_[pos_] : '\0'; }

    char next()
    {
        if (pos_ >= text_.size())
            fail("unexpected end of input");
        return text_[pos_++];
    }

    void expect(char c)
    {
        if (next() != c)
            fail(std::string("expected '") + c + "'");
    }

    bool consume(std::string_view word)
    {
        if (text_.compare(pos_, word.size(), word) != 0)
            return false;
        pos_ += word.size();
        return true;
    }

    void skip_ws()
    {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_])))
            ++pos_;
    }

    void finish()
    {
        skip_ws();
        if (pos_ != text_.size())
            fail("trailing characters");
    }

    std::string read_string()
    {
        expect('"');
        std::string out;
        while (true)
        {
            char c = next();
            if (c == '"')
                return out;
            if (c != '\\')
            {
                out += c;
                continue;
            }
            char e = next();
            switch (e)
            {
                case '"':
                case '\\':
                case '/':
                    out += e;
                    break;
                case 'n':
                    out += '\n';
                    break;
                case 't':
                    out += '\t';
                    break;
                case 'r':
                    out += '\r';
                    break;
                case 'b':
                    out += '\b';
                    break;
                case 'f':
                    out += '\f';
                    break;
                case 'u':
                    append_utf8(out, read_hex4());
                    break;
                default:
                    fail(std::string("bad escape '\\") + e + "'");
            }
        }
    }

    unsigned read_hex4()
    {
        unsigned cp = 0;
        for (int i = 0; i < 4; ++i)
        {
            char c = next();
            cp <<= 4;
            if (c >= '0' && c <= '9')
                cp |= static_cast<unsigned>(c - '0');
            else if (c >= 'a' && c <= 'f')
                cp |= static_cast<unsigned>(c - 'a' + 10);
            else if (c >= 'A' && c <= 'F')
                cp |= static_cast<unsigned>(c - 'A' + 10);
            else
                fail("bad \\u escape");
        }
        return cp;
    }

    std::optional<std::string> read_value(const std::string& key)
    {
        char c = peek();
        if (c == '"')
            return read_string();
        if (c == '{' || c == '[')
            fail("value of '" + key + "' must be a string, number or boolean");
        if (consume("true"))
            return std::string("true");
        if (consume("false"))
            return std::string("false");
        if (consume("null"))
            return std::nullopt;

        const size_t start = pos_;
        while (pos_ < text_.size())
        {
            char d = text_[pos_];
            if (!(std::isdigit(static_cast<unsigned char>(d)) || d == '-' || d == '+' || d == '.'
                  || d == 'e' || d == 'E'))
                break;
            ++pos_;
        }
        if (pos_ == start)
            fail("unexpected value for '" + key + "'");
        return text_.substr(start, pos_ - start);
    }

    const std::string& text_;
    const std::string& source_;
    size_t             pos_ = 0;
};

}   // namespace

RawParams parse_params_json(const std::string& text, const std::string& source)
{
    return FlatJsonReader(text, source).read();
}

RawParams load_params_file(const std::string& path)
{
    std::ifstream in(path);
    if (!in.is_open())
        throw ConfigError("cannot open parameters file " + path);
    std::ostringstream buf;
    buf << in.rdbuf();
    return parse_params_json(buf.str(), path);
}

// ─── Command line ───────────────────────────────────────────────────────────

CommandLine parse_command_line(int argc, const char* const* argv)
{
    CommandLine                cmd;
    std::optional<std::string> params_file;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            cmd.help = true;
            continue;
        }
        if (arg.size() < 3 || arg.compare(0, 2, "--") != 0)
            throw ConfigError("unexpected argument '" + arg + "'");

        std::string key = arg.substr(2);
        std::string value;
        auto        eq = key.find('=');
        if (eq != std::string::npos)
        {
            value = key.substr(eq + 1);
            key   = key.substr(0, eq);
        }
        else
        {
            if (i + 1 >= argc)
                throw ConfigError("missing value for --" + key);
            value = argv[++i];
        }
        if (key.empty())
            throw ConfigError("unexpected argument '" + arg + "'");

        if (key == "params")
            params_file = value;
        else if (key == "log-level")
            cmd.log_level = value;
        else if (key == "log-file")
            cmd.log_file = value;
        else
            cmd.params[key] = value;
    }

    if (params_file)
    {
        // Explicit keys were inserted first, so insert() keeps them.
        RawParams defaults = load_params_file(*params_file);
        cmd.params.insert(defaults.begin(), defaults.end());
    }
    return cmd;
}

void configure_logging(const CommandLine& cmd)
{
    auto& logger = Logger::instance();
    if (cmd.log_level)
    {
        auto level = parse_log_level(*cmd.log_level);
        if (!level)
            throw ConfigError("unknown log level '" + *cmd.log_level + "'");
        logger.set_level(*level);
    }
    logger.clear_sinks();
    logger.add_sink(sinks::console_sink());
    if (cmd.log_file)
        logger.add_sink(sinks::file_sink(*cmd.log_file));
}

}   // namespace gigmap

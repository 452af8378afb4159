#include "popswarm/config/SettingsParser.hpp"
#include "popswarm/render/Theme.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <unordered_map>

namespace pswarm {

namespace {

using Value = SettingsParser::Value;
using Entry = SettingsParser::Entry;

enum class TokenKind {
    Integer,
    Float,
    String,
    Word,           // names, `let`, `true`, `false`
    Symbol,         // one of { } [ ] : ; , - =
    End,
    Bad
};

struct Token {
    TokenKind kind{TokenKind::End};
    std::string text;
    int line{1};
    Value literal;
};

constexpr const char* SYMBOLS = "{}[]:;,-=";

/**
 * Splits the source into tokens on demand. Problems are appended to the
 * shared error list as "Line N: ..." and yield a Bad token.
 */
class Scanner {
public:
    Scanner(const std::string& source, std::vector<std::string>& errors)
        : source_(source), errors_(errors) {}

    Token next() {
        skipBlanks();

        Token token;
        token.line = line_;
        if (atEnd()) {
            return token;
        }

        const char c = source_[pos_];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            return number(token);
        }
        if (c == '"') {
            return quoted(token);
        }
        if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
            token.kind = TokenKind::Word;
            while (!atEnd() && (std::isalnum(static_cast<unsigned char>(source_[pos_])) || source_[pos_] == '_')) {
                token.text += take();
            }
            return token;
        }
        if (std::strchr(SYMBOLS, c)) {
            token.kind = TokenKind::Symbol;
            token.text = std::string(1, take());
            return token;
        }

        take();
        return bad(token, std::string("Unexpected character: ") + c);
    }

private:
    const std::string& source_;
    std::vector<std::string>& errors_;
    size_t pos_{0};
    int line_{1};

    bool atEnd() const { return pos_ >= source_.size(); }

    bool startsWith(const char* text) const {
        return source_.compare(pos_, std::strlen(text), text) == 0;
    }

    char take() {
        char c = source_[pos_++];
        if (c == '\n') ++line_;
        return c;
    }

    Token bad(Token token, const std::string& message) {
        errors_.push_back("Line " + std::to_string(token.line) + ": " + message);
        token.kind = TokenKind::Bad;
        return token;
    }

    void skipBlanks() {
        while (!atEnd()) {
            if (std::isspace(static_cast<unsigned char>(source_[pos_]))) {
                take();
            } else if (startsWith("//")) {
                while (!atEnd() && source_[pos_] != '\n') take();
            } else if (startsWith("/*")) {
                const int opened = line_;
                size_t close = source_.find("*/", pos_ + 2);
                if (close == std::string::npos) {
                    errors_.push_back("Line " + std::to_string(opened) + ": Unterminated block comment");
                    while (!atEnd()) take();
                    return;
                }
                while (pos_ < close + 2) take();
            } else {
                return;
            }
        }
    }

    Token number(Token token) {
        while (!atEnd() && std::isdigit(static_cast<unsigned char>(source_[pos_]))) {
            token.text += take();
        }

        if (startsWith(".") && pos_ + 1 < source_.size() &&
            std::isdigit(static_cast<unsigned char>(source_[pos_ + 1]))) {
            token.text += take();
            while (!atEnd() && std::isdigit(static_cast<unsigned char>(source_[pos_]))) {
                token.text += take();
            }
            token.kind = TokenKind::Float;
            token.literal = std::strtod(token.text.c_str(), nullptr);
            return token;
        }

        errno = 0;
        long long value = std::strtoll(token.text.c_str(), nullptr, 10);
        if (errno == ERANGE || value > INT_MAX) {
            return bad(token, "Integer literal out of range: " + token.text);
        }

        token.kind = TokenKind::Integer;
        token.literal = static_cast<int>(value);
        return token;
    }

    Token quoted(Token token) {
        take();

        std::string text;
        while (!atEnd() && source_[pos_] != '"' && source_[pos_] != '\n') {
            char c = take();
            if (c == '\\' && !atEnd()) {
                char escaped = take();
                text += escaped == 'n' ? '\n' : escaped == 't' ? '\t' : escaped;
            } else {
                text += c;
            }
        }

        if (atEnd() || source_[pos_] != '"') {
            return bad(token, "Unterminated string");
        }
        take();

        token.kind = TokenKind::String;
        token.text = text;
        token.literal = std::move(text);
        return token;
    }
};

/**
 * Reads blocks and evaluates values as it goes, so `let` names are visible
 * to every later line. Stops at the first syntax error.
 */
class Reader {
public:
    explicit Reader(const std::string& source) : scanner_(source, errors_) { advance(); }

    bool read(std::vector<Entry>& entries) {
        while (ok() && current_.kind != TokenKind::End) {
            if (current_.kind != TokenKind::Word) {
                fail("Expected top-level block");
                break;
            }

            std::string name = current_.text;
            advance();
            if (!expect(":", "Expected ':' after block name")) break;
            if (!isSymbol("{")) {
                fail("Expected '{' to start block '" + name + "'");
                break;
            }
            readBlock(name, entries);
        }
        return ok();
    }

    const std::vector<std::string>& getErrors() const { return errors_; }

private:
    std::vector<std::string> errors_;
    Scanner scanner_;
    Token current_;
    std::unordered_map<std::string, Value> variables_;

    bool ok() const { return errors_.empty(); }

    void advance() { current_ = scanner_.next(); }

    bool isSymbol(const char* symbol) const {
        return current_.kind == TokenKind::Symbol && current_.text == symbol;
    }

    bool accept(const char* symbol) {
        if (!isSymbol(symbol)) return false;
        advance();
        return true;
    }

    bool expect(const char* symbol, const std::string& message) {
        if (accept(symbol)) return true;
        fail(message);
        return false;
    }

    void fail(const std::string& message) {
        // The scanner already reported a bad token
        if (current_.kind == TokenKind::Bad) return;
        errors_.push_back("Line " + std::to_string(current_.line) + ": " + message);
    }

    // current_ is the opening brace
    void readBlock(const std::string& name, std::vector<Entry>& entries) {
        advance();

        while (ok() && !isSymbol("}") && current_.kind != TokenKind::End) {
            if (current_.kind != TokenKind::Word) {
                fail("Expected setting in block '" + name + "'");
                return;
            }

            if (current_.text == "let") {
                advance();
                readLet();
                continue;
            }

            const std::string key = current_.text;
            const int line = current_.line;
            advance();
            if (!expect(":", "Expected ':' after '" + key + "'")) return;

            if (isSymbol("{")) {
                readBlock(key, entries);
                continue;
            }

            auto value = readValue();
            if (!ok()) return;

            entries.push_back(Entry{name, key, line, std::move(value)});
            if (!accept(";")) accept(",");
        }

        if (ok()) {
            expect("}", "Expected '}' to close block '" + name + "'");
            accept(";");
        }
    }

    void readLet() {
        if (current_.kind != TokenKind::Word) {
            fail("Expected identifier after 'let'");
            return;
        }

        std::string name = current_.text;
        advance();
        if (!expect("=", "Expected '=' after '" + name + "'")) return;

        auto value = readValue();
        if (!ok()) return;

        if (value) {
            variables_[name] = std::move(*value);
        }
        accept(";");
    }

    // nullopt with ok() still true: valid syntax, but no usable value
    std::optional<Value> readValue() {
        if (accept("-")) {
            auto operand = readValue();
            if (!operand) return std::nullopt;
            if (auto* i = std::get_if<int>(&*operand)) return Value{-*i};
            if (auto* d = std::get_if<double>(&*operand)) return Value{-*d};
            return std::nullopt;
        }

        switch (current_.kind) {
            case TokenKind::Integer:
            case TokenKind::Float:
            case TokenKind::String: {
                Value literal = current_.literal;
                advance();
                return literal;
            }
            case TokenKind::Word: {
                std::string word = current_.text;
                advance();
                if (word == "true") return Value{true};
                if (word == "false") return Value{false};

                auto it = variables_.find(word);
                if (it == variables_.end()) return std::nullopt;
                return it->second;
            }
            default:
                break;
        }

        if (accept("[")) {
            return readList();
        }

        fail("Expected value");
        return std::nullopt;
    }

    // current_ is just past the opening bracket
    std::optional<Value> readList() {
        std::vector<std::string> items;
        bool usable = true;

        if (!isSymbol("]")) {
            do {
                auto item = readValue();
                if (!ok()) return std::nullopt;

                if (item && std::holds_alternative<std::string>(*item)) {
                    items.push_back(std::get<std::string>(*item));
                } else if (item && std::holds_alternative<int>(*item)) {
                    items.push_back(std::to_string(std::get<int>(*item)));
                } else {
                    usable = false;
                }
            } while (accept(","));
        }

        if (!expect("]", "Expected ']' after list items")) return std::nullopt;
        if (!usable) return std::nullopt;
        return Value{std::move(items)};
    }
};

// Returns false when the value has the wrong type for the setting
using Setter = std::function<bool(const Value&, Settings&)>;

template <typename T, typename Field>
Setter assign(Field field) {
    return [field](const Value& value, Settings& settings) {
        if (auto* v = std::get_if<T>(&value)) {
            field(settings) = *v;
            return true;
        }
        return false;
    };
}

template <typename Field>
Setter setDecimal(Field field) {
    return [field](const Value& value, Settings& settings) {
        if (auto* d = std::get_if<double>(&value)) {
            field(settings) = *d;
        } else if (auto* i = std::get_if<int>(&value)) {
            field(settings) = static_cast<double>(*i);
        } else {
            return false;
        }
        return true;
    };
}

template <typename Field>
Setter setColor(Field field) {
    return [field](const Value& value, Settings& settings) {
        auto* text = std::get_if<std::string>(&value);
        if (!text || !parseColor(*text)) return false;
        field(settings) = *text;
        return true;
    };
}

template <typename Field>
Setter setList(Field field) {
    return [field](const Value& value, Settings& settings) {
        if (auto* list = std::get_if<std::vector<std::string>>(&value)) {
            field(settings) = *list;
        } else if (auto* single = std::get_if<std::string>(&value)) {
            field(settings) = {*single};
        } else {
            return false;
        }
        return true;
    };
}

#define POPSWARM_FIELD(path) [](Settings& s) -> auto& { return s.path; }

const std::unordered_map<std::string, Setter>& setters() {
    static const std::unordered_map<std::string, Setter> table = {
        {"popups.opacity",        setDecimal(POPSWARM_FIELD(popups.opacity))},
        {"popups.multi_click",    assign<bool>(POPSWARM_FIELD(popups.multi_click))},
        {"popups.max_clicks",     assign<int>(POPSWARM_FIELD(popups.max_clicks))},
        {"popups.clickthrough",   assign<bool>(POPSWARM_FIELD(popups.clickthrough))},
        {"popups.buttonless",     assign<bool>(POPSWARM_FIELD(popups.buttonless))},
        {"popups.denial_chance",  setDecimal(POPSWARM_FIELD(popups.denial_chance))},
        {"popups.captions",       assign<bool>(POPSWARM_FIELD(popups.captions))},
        {"popups.panic_key",      assign<std::string>(POPSWARM_FIELD(popups.panic_key))},
        {"movement.chance",       setDecimal(POPSWARM_FIELD(movement.chance))},
        {"movement.speed",        assign<int>(POPSWARM_FIELD(movement.speed))},
        {"timeout.enabled",       assign<bool>(POPSWARM_FIELD(timeout.enabled))},
        {"timeout.delay",         assign<int>(POPSWARM_FIELD(timeout.delay_ms))},
        {"lowkey.enabled",        assign<bool>(POPSWARM_FIELD(lowkey.enabled))},
        {"lowkey.corner",         assign<int>(POPSWARM_FIELD(lowkey.corner))},
        {"mitosis.enabled",       assign<bool>(POPSWARM_FIELD(mitosis.enabled))},
        {"mitosis.strength",      assign<int>(POPSWARM_FIELD(mitosis.strength))},
        {"web.on_close",          assign<bool>(POPSWARM_FIELD(web.on_close))},
        {"web.chance",            setDecimal(POPSWARM_FIELD(web.chance))},
        {"theme.fg",              setColor(POPSWARM_FIELD(theme.fg))},
        {"theme.bg",              setColor(POPSWARM_FIELD(theme.bg))},
        {"theme.font",            assign<std::string>(POPSWARM_FIELD(theme.font))},
        {"theme.font_size",       assign<int>(POPSWARM_FIELD(theme.font_size))},
        {"monitors.disabled",     setList(POPSWARM_FIELD(monitors.disabled))},
    };
    return table;
}

#undef POPSWARM_FIELD

}

SettingsParser::SettingsParser(ErrorCallback on_error) : on_error_(std::move(on_error)) {}

bool SettingsParser::load(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        reportError("Config file not found: " + path.string());
        return false;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        reportError("Failed to open config file: " + path.string());
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    return loadFromString(buffer.str());
}

bool SettingsParser::loadFromString(const std::string& source) {
    std::vector<Entry> entries;

    Reader reader(source);
    if (!reader.read(entries)) {
        for (const auto& error : reader.getErrors()) {
            reportError(error);
        }
        return false;
    }

    Settings settings = settings_;
    for (const auto& entry : entries) {
        applyEntry(entry, settings);
    }

    validate(settings);
    settings_ = std::move(settings);
    return true;
}

std::string SettingsParser::getEmbeddedConfig() {
    return R"(
popswarm: {
    popups: {
        opacity: 1.0
        multi_click: false
        max_clicks: 3
        clickthrough: false
        buttonless: false
        denial_chance: 0
        captions: false
        panic_key: "Escape"
    }

    movement: {
        chance: 0
        speed: 10
    }

    // Fade out after delay (ms)
    timeout: {
        enabled: false
        delay: 10000
    }

    // corner: 0 top-left, 1 top-right, 2 bottom-left, 3 bottom-right, 4 random
    lowkey: {
        enabled: false
        corner: 4
    }

    mitosis: {
        enabled: false
        strength: 2
    }

    web: {
        on_close: false
        chance: 0
    }

    // Captions, denial text and the close button
    theme: {
        fg: "#ffffff"
        bg: "#262626e6"
        font: "Sans"
        font_size: 12
    }

    monitors: {
        disabled: []
    }
}
)";
}

std::filesystem::path SettingsParser::getDefaultConfigPath() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "popswarm" / "popswarm.wmi";
    }

    auto home = std::getenv("HOME");
    if (!home) return "/etc/popswarm/popswarm.wmi";

    return std::filesystem::path(home) / ".config" / "popswarm" / "popswarm.wmi";
}

void SettingsParser::applyEntry(const Entry& entry, Settings& settings) {
    const std::string name = entry.block + "." + entry.key;
    const std::string where = "Line " + std::to_string(entry.line) + ": ";

    auto setter = setters().find(name);
    if (setter == setters().end()) {
        reportError(where + "unknown setting " + name);
        return;
    }

    if (!entry.value) {
        reportError(where + "cannot evaluate " + name);
        return;
    }

    if (!setter->second(*entry.value, settings)) {
        reportError(where + "wrong type for " + name + ", keeping previous value");
    }
}

void SettingsParser::validate(Settings& settings) {
    auto percent = [](double& value) { value = std::clamp(value, 0.0, 100.0); };

    settings.popups.opacity = std::clamp(settings.popups.opacity, 0.0, 1.0);
    settings.popups.max_clicks = std::max(1, settings.popups.max_clicks);
    percent(settings.popups.denial_chance);

    percent(settings.movement.chance);
    settings.movement.speed = std::max(0, settings.movement.speed);

    settings.timeout.delay_ms = std::max(0, settings.timeout.delay_ms);

    settings.lowkey.corner = std::clamp(settings.lowkey.corner, 0, 4);

    settings.mitosis.strength = std::max(0, settings.mitosis.strength);

    percent(settings.web.chance);

    settings.theme.font_size = std::max(1, settings.theme.font_size);
    if (settings.theme.font.empty()) {
        settings.theme.font = "Sans";
    }
}

void SettingsParser::reportError(const std::string& message) {
    if (on_error_) {
        on_error_(message);
    } else {
        std::cerr << "SettingsParser: " << message << std::endl;
    }
}

}

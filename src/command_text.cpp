#include "shellguard/command_text.hpp"

#include <cctype>
#include <map>
#include <optional>
#include <set>

namespace shellguard {

namespace {

enum class Quote { None, Single, Double };

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string trim(const std::string& s) {
    std::size_t begin = 0;
    std::size_t end = s.size();
    while (begin < end && is_space(s[begin])) ++begin;
    while (end > begin && is_space(s[end - 1])) --end;
    return s.substr(begin, end - begin);
}

void replace_all(std::string& s, const std::string& from, const std::string& to) {
    std::size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

// Whitespace-separated words with quotes removed.
std::vector<std::string> split_words(const std::string& segment) {
    std::vector<std::string> words;
    std::string current;
    bool have_word = false;
    Quote quote = Quote::None;

    for (std::size_t i = 0; i < segment.size(); ++i) {
        char c = segment[i];
        if (quote == Quote::Single) {
            if (c == '\'') quote = Quote::None;
            else current += c;
            continue;
        }
        if (c == '\\' && i + 1 < segment.size()) {
            current += segment[++i];
            have_word = true;
            continue;
        }
        if (quote == Quote::Double) {
            if (c == '"') quote = Quote::None;
            else current += c;
            continue;
        }
        if (c == '\'') { quote = Quote::Single; have_word = true; continue; }
        if (c == '"')  { quote = Quote::Double; have_word = true; continue; }
        if (is_space(c)) {
            if (have_word) words.push_back(current);
            current.clear();
            have_word = false;
            continue;
        }
        current += c;
        have_word = true;
    }
    if (have_word) words.push_back(current);
    return words;
}

bool is_assignment(const std::string& word) {
    auto eq = word.find('=');
    if (eq == std::string::npos || eq == 0) return false;
    for (std::size_t i = 0; i < eq; ++i) {
        unsigned char c = static_cast<unsigned char>(word[i]);
        if (!(std::isalnum(c) || c == '_')) return false;
    }
    return !std::isdigit(static_cast<unsigned char>(word[0]));
}

// Length of the redirection operator (with its fd number) that starts
// `word`, or 0 when the word is not a redirection.
std::size_t redirection_length(const std::string& word) {
    static const char* const operators[] = {
        "<<<", "<<-", "&>>", ">>", "<<", ">&", "<&", "&>", ">|", "<>", ">", "<"
    };
    std::size_t i = 0;
    while (i < word.size() && std::isdigit(static_cast<unsigned char>(word[i]))) ++i;
    for (const char* op : operators) {
        std::string text(op);
        if (word.compare(i, text.size(), text) == 0) return i + text.size();
    }
    return 0;
}

// Words the shell passes to the command: redirections and their targets
// are removed wherever they appear.
std::vector<std::string> command_words(const std::string& segment) {
    auto words = split_words(segment);
    std::vector<std::string> out;
    for (std::size_t i = 0; i < words.size(); ++i) {
        auto length = redirection_length(words[i]);
        if (length == 0) {
            out.push_back(words[i]);
        } else if (length == words[i].size()) {
            ++i;    // bare operator, the target is the next word
        }
    }
    return out;
}

std::string base_name(const std::string& word) {
    auto slash = word.find_last_of('/');
    return slash == std::string::npos ? word : word.substr(slash + 1);
}

/// Option syntax of a command that runs another command.
struct WrapperSyntax {
    std::string           flags;              // short options without a value
    std::string           valued;             // short options taking a value
    std::set<std::string> long_flags;
    std::set<std::string> long_valued;
    std::size_t           operands = 0;       // words between options and the command
    bool                  numeric = false;    // accepts -N, as in nice -10
};

const std::map<std::string, WrapperSyntax>& wrappers() {
    static const std::map<std::string, WrapperSyntax> table {
        { "builtin", {} },
        { "command", { "pvV", "", {}, {} } },
        { "env",     { "i0v", "uC", { "ignore-environment", "null", "debug" }, { "unset", "chdir" } } },
        { "exec",    { "cl", "a", {}, {} } },
        { "nice",    { "", "n", {}, { "adjustment" }, 0, true } },
        { "nohup",   {} },
        { "time",    { "pavq", "of", { "portability", "append", "verbose", "quiet" }, { "output", "format" } } },
        { "timeout", { "v", "sk", { "preserve-status", "foreground", "verbose" }, { "signal", "kill-after" }, 1 } },
    };
    return table;
}

bool all_digits(const std::string& s, std::size_t from) {
    if (from >= s.size()) return false;
    for (std::size_t i = from; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

// Index of the wrapped command after the options and operands that start
// at `i`, or nullopt when an option is not understood.
std::optional<std::size_t> skip_wrapper_arguments(const WrapperSyntax& syntax,
                                                  const std::vector<std::string>& words,
                                                  std::size_t i) {
    while (i < words.size()) {
        const auto& word = words[i];
        if (word == "--") {
            ++i;
            break;
        }
        if (word.empty() || word[0] != '-') break;
        if (word.size() == 1) return std::nullopt;

        if (word[1] == '-') {
            auto eq = word.find('=');
            auto name = word.substr(2, eq == std::string::npos ? std::string::npos : eq - 2);
            if (eq == std::string::npos && syntax.long_flags.count(name)) {
                ++i;
            } else if (syntax.long_valued.count(name)) {
                i += eq == std::string::npos ? 2 : 1;
            } else {
                return std::nullopt;
            }
            continue;
        }

        if (syntax.numeric && all_digits(word, 1)) {
            ++i;
            continue;
        }

        bool value_follows = false;
        for (std::size_t k = 1; k < word.size(); ++k) {
            if (syntax.valued.find(word[k]) != std::string::npos) {
                value_follows = k + 1 == word.size();
                break;
            }
            if (syntax.flags.find(word[k]) == std::string::npos) return std::nullopt;
        }
        i += value_follows ? 2 : 1;
    }
    return i + syntax.operands;
}

} // namespace

std::string normalize_command(const std::string& command) {
    std::string text = command;
    replace_all(text, "${IFS}", " ");
    replace_all(text, "$IFS", " ");

    std::string out;
    out.reserve(text.size());
    bool pending_space = false;

    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\'' || c == '"') continue;
        if (c == '\\') {
            if (i + 1 >= text.size()) continue;
            c = text[++i];
            if (c == '\n') continue;  // line continuation
        }
        if (is_space(c)) {
            pending_space = true;
            continue;
        }
        if (pending_space && !out.empty()) out += ' ';
        pending_space = false;
        out += c;
    }
    return out;
}

std::vector<std::string> split_segments(const std::string& command) {
    std::vector<std::string> segments;
    std::vector<Quote> stack { Quote::None };
    std::string current;

    auto flush = [&]() {
        auto segment = trim(current);
        if (!segment.empty()) segments.push_back(segment);
        current.clear();
    };

    for (std::size_t i = 0; i < command.size(); ++i) {
        char c = command[i];
        Quote& quote = stack.back();
        bool opens_substitution = c == '$' && i + 1 < command.size() && command[i + 1] == '(';

        if (quote == Quote::Single) {
            if (c == '\'') quote = Quote::None;
            current += c;
            continue;
        }
        if (c == '\\' && i + 1 < command.size()) {
            current += c;
            current += command[++i];
            continue;
        }
        if (quote == Quote::Double) {
            if (c == '"') {
                quote = Quote::None;
                current += c;
            } else if (opens_substitution) {
                flush();
                stack.push_back(Quote::None);
                ++i;
            } else if (c == '`') {
                flush();
            } else {
                current += c;
            }
            continue;
        }

        switch (c) {
            case '\'':
                quote = Quote::Single;
                current += c;
                break;
            case '"':
                quote = Quote::Double;
                current += c;
                break;
            case '$':
                if (opens_substitution) {
                    flush();
                    stack.push_back(Quote::None);
                    ++i;
                } else {
                    current += c;
                }
                break;
            case '(':
                flush();
                stack.push_back(Quote::None);
                break;
            case ')':
                flush();
                if (stack.size() > 1) stack.pop_back();
                break;
            case '&': case '|': {
                // 2>&1, &>file and >|file are redirections, not separators.
                bool after_redirect = !current.empty() && (current.back() == '>' || current.back() == '<');
                bool before_redirect = c == '&' && i + 1 < command.size() && command[i + 1] == '>';
                if (after_redirect || before_redirect) current += c;
                else flush();
                break;
            }
            case ';': case '\n': case '`':
                flush();
                break;
            default:
                current += c;
                break;
        }
    }
    flush();
    return segments;
}

std::string executable_name(const std::string& segment) {
    static const std::set<std::string> keywords {
        "if", "then", "else", "elif", "fi", "do", "done", "while", "until",
        "!", "{", "}", "case", "esac"
    };

    auto words = command_words(segment);
    std::size_t i = 0;
    while (i < words.size()) {
        const auto& word = words[i];
        if (is_assignment(word) || keywords.count(word)) {
            ++i;
            continue;
        }
        auto name = base_name(word);
        auto wrapper = wrappers().find(name);
        if (wrapper == wrappers().end()) return name;

        // A wrapper whose arguments cannot be followed is itself the answer.
        auto next = skip_wrapper_arguments(wrapper->second, words, i + 1);
        if (!next || *next >= words.size()) return name;
        i = *next;
    }
    return {};
}

std::vector<std::string> executable_names(const std::string& command) {
    std::vector<std::string> names;
    for (const auto& segment : split_segments(command)) {
        auto name = executable_name(segment);
        if (!name.empty()) names.push_back(name);
    }
    return names;
}

} // namespace shellguard

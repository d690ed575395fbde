#include <evalforge/evaluation/formula_evaluator.h>

#include <fmt/format.h>
#include <cctype>
#include <charconv>
#include <string>

namespace evalforge::evaluation {

namespace {

using json = nlohmann::json;

double fieldValue(const json& sample, const std::string& path) {
    const json* node = &sample;
    std::size_t start = 0;
    while (start <= path.size()) {
        auto dot = path.find('.', start);
        auto key = path.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (!node->is_object())
            return 0.0;
        auto it = node->find(key);
        if (it == node->end())
            return 0.0;
        node = &*it;
        if (dot == std::string::npos)
            break;
        start = dot + 1;
    }
    if (node->is_number())
        return node->get<double>();
    if (node->is_boolean())
        return node->get<bool>() ? 1.0 : 0.0;
    return 0.0;
}

class Parser {
public:
    Parser(std::string_view src, const json& sample) : src_(src), sample_(sample) {}

    Result<double> run() {
        auto v = expression();
        if (!v)
            return v;
        skipSpace();
        if (pos_ != src_.size())
            return syntaxError("unexpected trailing input");
        return v;
    }

private:
    Result<double> expression() {
        auto lhs = term();
        if (!lhs)
            return lhs;
        double acc = lhs.value();
        while (true) {
            skipSpace();
            char op = pos_ < src_.size() ? src_[pos_] : '\0';
            if (op != '+' && op != '-')
                break;
            ++pos_;
            auto rhs = term();
            if (!rhs)
                return rhs;
            acc = op == '+' ? acc + rhs.value() : acc - rhs.value();
        }
        return acc;
    }

    Result<double> term() {
        auto lhs = unary();
        if (!lhs)
            return lhs;
        double acc = lhs.value();
        while (true) {
            skipSpace();
            char op = pos_ < src_.size() ? src_[pos_] : '\0';
            if (op != '*' && op != '/')
                break;
            ++pos_;
            auto rhs = unary();
            if (!rhs)
                return rhs;
            if (op == '*')
                acc *= rhs.value();
            else
                acc = rhs.value() == 0.0 ? 0.0 : acc / rhs.value();
        }
        return acc;
    }

    Result<double> unary() {
        skipSpace();
        if (consume('-')) {
            if (++depth_ > kMaxDepth)
                return syntaxError("expression nested too deeply");
            auto v = unary();
            --depth_;
            if (!v)
                return v;
            return -v.value();
        }
        return primary();
    }

    Result<double> primary() {
        skipSpace();
        if (pos_ >= src_.size())
            return syntaxError("unexpected end of formula");

        char c = src_[pos_];
        if (c == '(') {
            ++pos_;
            if (++depth_ > kMaxDepth)
                return syntaxError("expression nested too deeply");
            auto v = expression();
            --depth_;
            if (!v)
                return v;
            skipSpace();
            if (!consume(')'))
                return syntaxError("expected ')'");
            return v;
        }
        if (std::isdigit(static_cast<unsigned char>(c)) || c == '.')
            return number();
        if (std::isalpha(static_cast<unsigned char>(c)) || c == '_')
            return identifier();
        return syntaxError(fmt::format("unexpected character '{}'", c));
    }

    Result<double> number() {
        std::size_t begin = pos_;
        while (pos_ < src_.size() &&
               (std::isdigit(static_cast<unsigned char>(src_[pos_])) || src_[pos_] == '.'))
            ++pos_;
        double out = 0.0;
        auto text = src_.substr(begin, pos_ - begin);
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
        if (ec != std::errc{} || ptr != text.data() + text.size())
            return syntaxError(fmt::format("invalid number '{}'", text));
        return out;
    }

    Result<double> identifier() {
        std::size_t begin = pos_;
        while (pos_ < src_.size()) {
            char c = src_[pos_];
            if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.')
                ++pos_;
            else
                break;
        }
        return fieldValue(sample_, std::string(src_.substr(begin, pos_ - begin)));
    }

    void skipSpace() {
        while (pos_ < src_.size() && std::isspace(static_cast<unsigned char>(src_[pos_])))
            ++pos_;
    }

    bool consume(char c) {
        if (peekIs(c)) {
            ++pos_;
            return true;
        }
        return false;
    }

    bool peekIs(char c) const { return pos_ < src_.size() && src_[pos_] == c; }

    Error syntaxError(const std::string& what) const {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("formula '{}' at offset {}: {}", src_.substr(0, 64), pos_, what)};
    }

    // Bounds recursion through parentheses and unary minus.
    static constexpr std::size_t kMaxDepth = 256;

    std::string_view src_;
    const json& sample_;
    std::size_t pos_{0};
    std::size_t depth_{0};
};

} // namespace

Result<double> FormulaEvaluator::evaluate(std::string_view formula, const json& sample) {
    if (formula.find_first_not_of(" \t\r\n") == std::string_view::npos)
        return Error{ErrorCode::InvalidArgument, "empty formula"};
    return Parser{formula, sample}.run();
}

} // namespace evalforge::evaluation

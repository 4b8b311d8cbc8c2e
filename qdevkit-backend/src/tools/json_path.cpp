#include <qdevkit/json_path.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <memory>
#include <stdexcept>

namespace qdevkit {

namespace {

using Json = nlohmann::ordered_json;

class ExpressionError : public std::runtime_error {
public:
    ExpressionError(size_t position, const std::string& message)
        : std::runtime_error("Invalid JSONPath expression at position " +
                             std::to_string(position) + ": " + message) {}
};

// ========== Expression tree ==========

enum class SelectorKind { Name, Index, Wildcard, Slice, Filter };

enum class CompareOp { Exists, Eq, Ne, Lt, Le, Gt, Ge };

// @ followed by a chain of member names / indices
struct RelativePath {
    std::vector<std::string> names;     // Empty string paired with index >= 0 means [index]
    std::vector<long long> indices;
};

struct Predicate {
    // Leaf comparison
    RelativePath path;
    CompareOp op = CompareOp::Exists;
    Json literal;

    // Boolean combination, "&&" or "||" when set
    std::string logic;
    std::unique_ptr<Predicate> lhs;
    std::unique_ptr<Predicate> rhs;
};

struct Selector {
    SelectorKind kind = SelectorKind::Name;
    std::string name;
    long long index = 0;
    bool has_start = false;
    bool has_end = false;
    long long start = 0;
    long long end = 0;
    long long step = 1;
    std::shared_ptr<Predicate> filter;
};

struct Segment {
    bool recursive = false;
    std::vector<Selector> selectors;
};

// ========== Parser ==========

class Parser {
public:
    explicit Parser(const std::string& text) : text_(text) {}

    std::vector<Segment> Parse() {
        SkipSpaces();
        if (!Consume('$')) {
            throw ExpressionError(pos_, "expression must start with '$'");
        }

        std::vector<Segment> segments;
        while (true) {
            SkipSpaces();
            if (AtEnd()) break;

            Segment segment;
            if (Consume('.')) {
                if (Consume('.')) {
                    segment.recursive = true;
                    if (Peek() == '[') {
                        pos_++;
                        segment.selectors = ParseBracket();
                    } else {
                        segment.selectors.push_back(ParseDotMember());
                    }
                } else {
                    segment.selectors.push_back(ParseDotMember());
                }
            } else if (Consume('[')) {
                segment.selectors = ParseBracket();
            } else {
                throw ExpressionError(pos_, std::string("unexpected character '") + Peek() + "'");
            }
            segments.push_back(std::move(segment));
        }
        return segments;
    }

private:
    bool AtEnd() const { return pos_ >= text_.size(); }
    char Peek() const { return AtEnd() ? '\0' : text_[pos_]; }

    bool Consume(char c) {
        if (Peek() == c && !AtEnd()) {
            pos_++;
            return true;
        }
        return false;
    }

    bool ConsumeWord(const char* word) {
        size_t len = std::char_traits<char>::length(word);
        if (text_.compare(pos_, len, word) == 0) {
            pos_ += len;
            return true;
        }
        return false;
    }

    void Expect(char c) {
        SkipSpaces();
        if (!Consume(c)) {
            throw ExpressionError(pos_, std::string("expected '") + c + "'");
        }
    }

    void SkipSpaces() {
        while (!AtEnd() && std::isspace(static_cast<unsigned char>(text_[pos_]))) pos_++;
    }

    static bool IsNameChar(char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' ||
               (static_cast<unsigned char>(c) >= 0x80);
    }

    std::string ParseIdentifier() {
        size_t start = pos_;
        while (!AtEnd() && IsNameChar(text_[pos_])) pos_++;
        if (start == pos_) {
            throw ExpressionError(pos_, "expected a member name");
        }
        return text_.substr(start, pos_ - start);
    }

    std::string ParseQuoted() {
        char quote = text_[pos_++];
        std::string value;
        while (!AtEnd() && text_[pos_] != quote) {
            if (text_[pos_] == '\\' && pos_ + 1 < text_.size()) {
                pos_++;
            }
            value += text_[pos_++];
        }
        if (!Consume(quote)) {
            throw ExpressionError(pos_, "unterminated string literal");
        }
        return value;
    }

    bool PeekInteger() const {
        char c = Peek();
        if (c == '-' && pos_ + 1 < text_.size()) {
            c = text_[pos_ + 1];
        }
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    }

    long long ParseInteger() {
        size_t start = pos_;
        if (Peek() == '-') pos_++;
        while (!AtEnd() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) pos_++;
        std::string digits = text_.substr(start, pos_ - start);
        if (digits.empty() || digits == "-") {
            throw ExpressionError(start, "expected an integer");
        }
        try {
            return std::stoll(digits);
        } catch (const std::out_of_range&) {
            throw ExpressionError(start, "integer out of range");
        }
    }

    Selector ParseDotMember() {
        Selector sel;
        if (Consume('*')) {
            sel.kind = SelectorKind::Wildcard;
        } else {
            sel.kind = SelectorKind::Name;
            sel.name = ParseIdentifier();
        }
        return sel;
    }

    // Called after '['; consumes through ']'
    std::vector<Selector> ParseBracket() {
        std::vector<Selector> selectors;
        SkipSpaces();

        if (Consume('*')) {
            Selector sel;
            sel.kind = SelectorKind::Wildcard;
            selectors.push_back(sel);
            Expect(']');
            return selectors;
        }

        if (Consume('?')) {
            Selector sel;
            sel.kind = SelectorKind::Filter;
            Expect('(');
            sel.filter = std::shared_ptr<Predicate>(ParseOr().release());
            Expect(')');
            Expect(']');
            selectors.push_back(sel);
            return selectors;
        }

        while (true) {
            SkipSpaces();
            selectors.push_back(ParseBracketItem());
            SkipSpaces();
            if (Consume(',')) continue;
            if (Consume(']')) break;
            throw ExpressionError(pos_, "expected ',' or ']'");
        }
        return selectors;
    }

    Selector ParseBracketItem() {
        Selector sel;
        char c = Peek();

        if (c == '\'' || c == '"') {
            sel.kind = SelectorKind::Name;
            sel.name = ParseQuoted();
            return sel;
        }

        if (PeekInteger() || c == ':') {
            if (c != ':') {
                sel.index = ParseInteger();
                sel.start = sel.index;
                sel.has_start = true;
            }
            SkipSpaces();
            if (!Consume(':')) {
                sel.kind = SelectorKind::Index;
                return sel;
            }

            sel.kind = SelectorKind::Slice;
            SkipSpaces();
            if (PeekInteger()) {
                sel.end = ParseInteger();
                sel.has_end = true;
            }
            SkipSpaces();
            if (Consume(':')) {
                SkipSpaces();
                if (PeekInteger()) {
                    sel.step = ParseInteger();
                    if (sel.step == 0) {
                        throw ExpressionError(pos_, "slice step cannot be zero");
                    }
                }
            }
            return sel;
        }

        if (IsNameChar(c)) {
            sel.kind = SelectorKind::Name;
            sel.name = ParseIdentifier();
            return sel;
        }

        if (AtEnd()) {
            throw ExpressionError(pos_, "unterminated '['");
        }
        throw ExpressionError(pos_, std::string("unexpected character '") + c + "' in brackets");
    }

    // ----- Filter expressions -----

    std::unique_ptr<Predicate> ParseOr() {
        auto left = ParseAnd();
        while (true) {
            SkipSpaces();
            if (!ConsumeWord("||")) return left;
            auto node = std::make_unique<Predicate>();
            node->logic = "||";
            node->lhs = std::move(left);
            node->rhs = ParseAnd();
            left = std::move(node);
        }
    }

    std::unique_ptr<Predicate> ParseAnd() {
        auto left = ParseComparison();
        while (true) {
            SkipSpaces();
            if (!ConsumeWord("&&")) return left;
            auto node = std::make_unique<Predicate>();
            node->logic = "&&";
            node->lhs = std::move(left);
            node->rhs = ParseComparison();
            left = std::move(node);
        }
    }

    std::unique_ptr<Predicate> ParseComparison() {
        SkipSpaces();
        if (Consume('(')) {
            auto inner = ParseOr();
            Expect(')');
            return inner;
        }

        if (!Consume('@')) {
            throw ExpressionError(pos_, "filter must reference the current node with '@'");
        }

        auto pred = std::make_unique<Predicate>();
        while (true) {
            if (Consume('.')) {
                pred->path.names.push_back(ParseIdentifier());
                pred->path.indices.push_back(-1);
            } else if (Peek() == '[') {
                pos_++;
                SkipSpaces();
                if (Peek() == '\'' || Peek() == '"') {
                    pred->path.names.push_back(ParseQuoted());
                    pred->path.indices.push_back(-1);
                } else {
                    long long idx = ParseInteger();
                    if (idx < 0) {
                        throw ExpressionError(pos_, "negative index in filter path");
                    }
                    pred->path.names.emplace_back();
                    pred->path.indices.push_back(idx);
                }
                Expect(']');
            } else {
                break;
            }
        }

        SkipSpaces();
        if (ConsumeWord("==")) pred->op = CompareOp::Eq;
        else if (ConsumeWord("!=")) pred->op = CompareOp::Ne;
        else if (ConsumeWord("<=")) pred->op = CompareOp::Le;
        else if (ConsumeWord(">=")) pred->op = CompareOp::Ge;
        else if (ConsumeWord("<")) pred->op = CompareOp::Lt;
        else if (ConsumeWord(">")) pred->op = CompareOp::Gt;
        else return pred;

        SkipSpaces();
        pred->literal = ParseLiteral();
        return pred;
    }

    Json ParseLiteral() {
        char c = Peek();
        if (c == '\'' || c == '"') {
            return Json(ParseQuoted());
        }
        if (ConsumeWord("true")) return Json(true);
        if (ConsumeWord("false")) return Json(false);
        if (ConsumeWord("null")) return Json(nullptr);

        size_t start = pos_;
        if (Peek() == '-' || Peek() == '+') pos_++;
        while (!AtEnd() && (std::isdigit(static_cast<unsigned char>(text_[pos_])) ||
                            text_[pos_] == '.' || text_[pos_] == 'e' || text_[pos_] == 'E')) {
            pos_++;
        }
        std::string number = text_.substr(start, pos_ - start);
        if (number.empty()) {
            throw ExpressionError(pos_, "expected a literal after comparison operator");
        }
        try {
            return Json::parse(number);
        } catch (const nlohmann::json::parse_error&) {
            throw ExpressionError(start, "invalid number '" + number + "'");
        }
    }

    const std::string& text_;
    size_t pos_ = 0;
};

// ========== Evaluation ==========

const Json* Resolve(const Json& node, const RelativePath& path) {
    const Json* current = &node;
    for (size_t i = 0; i < path.names.size(); i++) {
        if (path.indices[i] >= 0) {
            if (!current->is_array() || static_cast<size_t>(path.indices[i]) >= current->size()) {
                return nullptr;
            }
            current = &(*current)[static_cast<size_t>(path.indices[i])];
        } else {
            if (!current->is_object()) return nullptr;
            auto it = current->find(path.names[i]);
            if (it == current->end()) return nullptr;
            current = &(*it);
        }
    }
    return current;
}

bool Compare(const Json& value, CompareOp op, const Json& literal) {
    switch (op) {
        case CompareOp::Exists: return true;
        case CompareOp::Eq: return value == literal;
        case CompareOp::Ne: return value != literal;
        default: break;
    }

    // Ordering only between two numbers or two strings
    bool comparable = (value.is_number() && literal.is_number()) ||
                      (value.is_string() && literal.is_string());
    if (!comparable) return false;

    switch (op) {
        case CompareOp::Lt: return value < literal;
        case CompareOp::Le: return value <= literal;
        case CompareOp::Gt: return value > literal;
        case CompareOp::Ge: return value >= literal;
        default: return false;
    }
}

bool Evaluate(const Predicate& pred, const Json& node) {
    if (!pred.logic.empty()) {
        bool left = Evaluate(*pred.lhs, node);
        if (pred.logic == "&&") return left && Evaluate(*pred.rhs, node);
        return left || Evaluate(*pred.rhs, node);
    }

    const Json* value = Resolve(node, pred.path);
    if (!value) return false;
    return Compare(*value, pred.op, pred.literal);
}

void CollectDescendants(const Json& node, std::vector<const Json*>& out) {
    out.push_back(&node);
    if (node.is_structured()) {
        for (const auto& child : node) {
            CollectDescendants(child, out);
        }
    }
}

void ApplySlice(const Json& array, const Selector& sel, std::vector<const Json*>& out) {
    long long len = static_cast<long long>(array.size());
    long long step = sel.step;

    auto normalize = [len](long long i) { return i < 0 ? i + len : i; };

    if (step > 0) {
        long long start = sel.has_start ? normalize(sel.start) : 0;
        long long end = sel.has_end ? normalize(sel.end) : len;
        start = std::max(0LL, std::min(start, len));
        end = std::max(0LL, std::min(end, len));
        // Compare the remaining distance before stepping so huge steps cannot overflow
        for (long long i = start; i < end; i += step) {
            out.push_back(&array[static_cast<size_t>(i)]);
            if (step >= end - i) break;
        }
    } else {
        long long start = sel.has_start ? normalize(sel.start) : len - 1;
        long long end = sel.has_end ? normalize(sel.end) : -1;
        start = std::max(-1LL, std::min(start, len - 1));
        end = std::max(-1LL, std::min(end, len - 1));
        for (long long i = start; i > end; i += step) {
            out.push_back(&array[static_cast<size_t>(i)]);
            if (step <= end - i) break;
        }
    }
}

void ApplySelector(const Json& node, const Selector& sel, std::vector<const Json*>& out) {
    switch (sel.kind) {
        case SelectorKind::Name:
            if (node.is_object()) {
                auto it = node.find(sel.name);
                if (it != node.end()) out.push_back(&(*it));
            }
            break;

        case SelectorKind::Index:
            if (node.is_array()) {
                long long idx = sel.index < 0 ? sel.index + static_cast<long long>(node.size()) : sel.index;
                if (idx >= 0 && idx < static_cast<long long>(node.size())) {
                    out.push_back(&node[static_cast<size_t>(idx)]);
                }
            }
            break;

        case SelectorKind::Wildcard:
            if (node.is_structured()) {
                for (const auto& child : node) out.push_back(&child);
            }
            break;

        case SelectorKind::Slice:
            if (node.is_array()) ApplySlice(node, sel, out);
            break;

        case SelectorKind::Filter:
            if (node.is_structured()) {
                for (const auto& child : node) {
                    if (Evaluate(*sel.filter, child)) out.push_back(&child);
                }
            }
            break;
    }
}

std::vector<const Json*> Run(const Json& root, const std::vector<Segment>& segments) {
    std::vector<const Json*> current{ &root };

    for (const auto& segment : segments) {
        std::vector<const Json*> candidates;
        if (segment.recursive) {
            for (const Json* node : current) CollectDescendants(*node, candidates);
        } else {
            candidates = current;
        }

        std::vector<const Json*> next;
        for (const Json* node : candidates) {
            for (const auto& sel : segment.selectors) {
                ApplySelector(*node, sel, next);
            }
        }
        current = std::move(next);
    }
    return current;
}

} // namespace

bool JsonPath::IsValidExpression(const std::string& expression, std::string& error) {
    try {
        Parser(expression).Parse();
        return true;
    } catch (const ExpressionError& e) {
        error = e.what();
        return false;
    }
}

JsonPathResult JsonPath::Filter(const std::string& json_text, const std::string& expression) {
    JsonPathResult result;
    result.expression = expression;

    std::vector<Segment> segments;
    try {
        segments = Parser(expression).Parse();
    } catch (const ExpressionError& e) {
        result.error = ToolErrorKind::InvalidExpression;
        result.error_message = e.what();
        return result;
    }

    Json document;
    try {
        document = Json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        result.error = ToolErrorKind::ParseError;
        result.error_message = std::string("Invalid JSON: ") + e.what();
        return result;
    }

    std::vector<const Json*> matches = Run(document, segments);
    result.match_count = static_cast<int>(matches.size());

    Json output;
    if (matches.size() == 1) {
        output = *matches.front();
    } else {
        output = Json::array();
        for (const Json* match : matches) output.push_back(*match);
    }

    result.output = output.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    result.success = true;

    spdlog::debug("JSONPath '{}' matched {} node(s)", expression, result.match_count);
    return result;
}

std::vector<std::pair<std::string, std::string>> JsonPath::GetExamples() {
    return {
        { "$.items[*]", "All items" },
        { "$.user.name", "Field" },
        { "$.users[0]", "Index" },
        { "$.users[?(@.age > 25)]", "Filter" },
        { "$..[name, email]", "Multi" },
        { "$", "Root" },
    };
}

} // namespace qdevkit

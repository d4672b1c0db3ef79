#include "judge/comparator.hpp"
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace grader {
using namespace std;

static bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

vector<string> normalized_lines(const string &text) {
    vector<string> lines;
    size_t begin = 0;
    while (begin <= text.size()) {
        size_t end = text.find('\n', begin);
        if (end == string::npos) end = text.size();
        size_t last = end;
        while (last > begin && (text[last - 1] == ' ' || text[last - 1] == '\t' || text[last - 1] == '\r'))
            --last;
        lines.push_back(text.substr(begin, last - begin));
        begin = end + 1;
    }
    while (!lines.empty() && lines.back().empty())
        lines.pop_back();
    return lines;
}

vector<string> split_tokens(const string &text) {
    vector<string> tokens;
    size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && is_space(text[i])) ++i;
        size_t begin = i;
        while (i < text.size() && !is_space(text[i])) ++i;
        if (i > begin) tokens.push_back(text.substr(begin, i - begin));
    }
    return tokens;
}

static optional<double> parse_number(const string &token) {
    const char *begin = token.c_str();
    char *end = nullptr;
    errno = 0;
    double value = strtod(begin, &end);
    if (end == begin || *end != '\0' || errno == ERANGE || !isfinite(value))
        return nullopt;
    return value;
}

static bool numbers_close(double actual, double expected,
                          optional<double> abs_epsilon, optional<double> rel_epsilon) {
    double diff = fabs(actual - expected);
    if (abs_epsilon && diff <= *abs_epsilon) return true;
    if (rel_epsilon && diff <= *rel_epsilon * fabs(expected)) return true;
    return false;
}

bool compare_exact(const string &actual, const string &expected) {
    return actual == expected;
}

bool compare_trimmed(const string &actual, const string &expected) {
    return normalized_lines(actual) == normalized_lines(expected);
}

bool compare_tokens(const string &actual, const string &expected,
                    optional<double> abs_epsilon, optional<double> rel_epsilon) {
    vector<string> actual_tokens = split_tokens(actual);
    vector<string> expected_tokens = split_tokens(expected);
    if (actual_tokens.size() != expected_tokens.size()) return false;

    bool tolerant = abs_epsilon || rel_epsilon;
    for (size_t i = 0; i < actual_tokens.size(); ++i) {
        if (actual_tokens[i] == expected_tokens[i]) continue;
        if (!tolerant) return false;

        auto a = parse_number(actual_tokens[i]);
        auto b = parse_number(expected_tokens[i]);
        if (!a || !b || !numbers_close(*a, *b, abs_epsilon, rel_epsilon))
            return false;
    }
    return true;
}

verdict compare_output(const string &actual, const test_case &test) {
    bool same;
    switch (test.mode) {
        case comparison_mode::EXACT:
            same = compare_exact(actual, test.expected_output);
            break;
        case comparison_mode::TRIM:
            same = compare_trimmed(actual, test.expected_output);
            break;
        case comparison_mode::TOKENS:
            same = compare_tokens(actual, test.expected_output, test.abs_epsilon, test.rel_epsilon);
            break;
        default:
            throw logic_error("comparison mode " + string(get_name(test.mode)) + " is not handled by compare_output");
    }
    return same ? verdict::PASS : verdict::WRONG_ANSWER;
}

}  // namespace grader

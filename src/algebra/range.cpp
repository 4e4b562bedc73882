#include <weft/range.hpp>
#include <algorithm>
#include <cstring>

namespace weft {

// ---------------------------------------------------------------------------
// Bound ordering
// ---------------------------------------------------------------------------

// Does lower bound `a` admit versions earlier than `b`? Unbounded is earliest.
static bool starts_before(const std::optional<Bound>& a,
                          const std::optional<Bound>& b) {
    if (!b) return false;
    if (!a) return true;
    int c = a->version.compare(b->version);
    if (c != 0) return c < 0;
    return a->inclusive && !b->inclusive;
}

// Does upper bound `a` admit versions later than `b`? Unbounded is latest.
static bool ends_after(const std::optional<Bound>& a,
                       const std::optional<Bound>& b) {
    if (!b) return false;
    if (!a) return true;
    int c = a->version.compare(b->version);
    if (c != 0) return c > 0;
    return a->inclusive && !b->inclusive;
}

// [low, high) where a missing side is unbounded
static Interval up_to(std::optional<SemVer> low, std::optional<SemVer> high) {
    Interval i;
    if (low) i.lower = Bound{std::move(*low), true};
    if (high) i.upper = Bound{std::move(*high), false};
    return i;
}

// ---------------------------------------------------------------------------
// Interval
// ---------------------------------------------------------------------------

Interval Interval::at_least(SemVer v) {
    return Interval{Bound{std::move(v), true}, std::nullopt};
}

Interval Interval::greater_than(SemVer v) {
    return Interval{Bound{std::move(v), false}, std::nullopt};
}

Interval Interval::at_most(SemVer v) {
    return Interval{std::nullopt, Bound{std::move(v), true}};
}

Interval Interval::less_than(SemVer v) {
    return Interval{std::nullopt, Bound{std::move(v), false}};
}

Interval Interval::between(SemVer low, SemVer high) {
    return Interval{Bound{std::move(low), true}, Bound{std::move(high), false}};
}

Interval Interval::point(SemVer v) {
    return Interval{Bound{v, true}, Bound{v, true}};
}

bool Interval::contains(const SemVer& v) const {
    if (lower) {
        int c = v.compare(lower->version);
        if (c < 0 || (c == 0 && !lower->inclusive)) return false;
    }
    if (upper) {
        int c = v.compare(upper->version);
        if (c > 0 || (c == 0 && !upper->inclusive)) return false;
    }
    return true;
}

bool Interval::is_empty() const {
    if (!lower || !upper) return false;
    int c = lower->version.compare(upper->version);
    if (c != 0) return c > 0;
    return !(lower->inclusive && upper->inclusive);
}

std::optional<Interval> Interval::intersect(const Interval& other) const {
    Interval r;
    r.lower = starts_before(lower, other.lower) ? other.lower : lower;
    r.upper = ends_after(upper, other.upper) ? other.upper : upper;
    if (r.is_empty()) return std::nullopt;
    return r;
}

std::string Interval::to_string() const {
    if (!lower && !upper) return "*";
    if (lower && upper && lower->inclusive && upper->inclusive &&
        lower->version == upper->version) {
        return "=" + lower->version.to_string();
    }

    std::string s;
    if (lower) {
        s += lower->inclusive ? ">=" : ">";
        s += lower->version.to_string();
    }
    if (upper) {
        if (!s.empty()) s += ", ";
        s += upper->inclusive ? "<=" : "<";
        s += upper->version.to_string();
    }
    return s;
}

// ---------------------------------------------------------------------------
// RangeSet
// ---------------------------------------------------------------------------

RangeSet RangeSet::everything() {
    RangeSet r;
    r.intervals_.push_back(Interval{});
    return r;
}

RangeSet RangeSet::exactly(const SemVer& v) {
    RangeSet r;
    r.intervals_.push_back(Interval::point(v));
    return r;
}

RangeSet RangeSet::from_intervals(std::vector<Interval> intervals) {
    intervals.erase(std::remove_if(intervals.begin(), intervals.end(),
                        [](const Interval& i) { return i.is_empty(); }),
                    intervals.end());
    std::sort(intervals.begin(), intervals.end(),
              [](const Interval& a, const Interval& b) {
                  return starts_before(a.lower, b.lower);
              });

    RangeSet r;
    for (auto& next : intervals) {
        if (r.intervals_.empty()) {
            r.intervals_.push_back(std::move(next));
            continue;
        }

        Interval& cur = r.intervals_.back();
        bool joins = false;
        if (!cur.upper || !next.lower) {
            joins = true;
        } else {
            int c = next.lower->version.compare(cur.upper->version);
            // touching spans merge unless the shared version is excluded twice
            joins = c < 0 || (c == 0 && (next.lower->inclusive || cur.upper->inclusive));
        }

        if (joins) {
            if (ends_after(next.upper, cur.upper)) cur.upper = next.upper;
        } else {
            r.intervals_.push_back(std::move(next));
        }
    }
    return r;
}

bool RangeSet::contains(const SemVer& v) const {
    return std::any_of(intervals_.begin(), intervals_.end(),
        [&](const Interval& i) { return i.contains(v); });
}

bool RangeSet::is_everything() const {
    return intervals_.size() == 1 && !intervals_[0].lower && !intervals_[0].upper;
}

RangeSet RangeSet::intersect(const RangeSet& other) const {
    std::vector<Interval> parts;
    for (const auto& a : intervals_) {
        for (const auto& b : other.intervals_) {
            if (auto i = a.intersect(b)) {
                parts.push_back(std::move(*i));
            }
        }
    }
    return from_intervals(std::move(parts));
}

RangeSet RangeSet::unite(const RangeSet& other) const {
    std::vector<Interval> parts = intervals_;
    parts.insert(parts.end(), other.intervals_.begin(), other.intervals_.end());
    return from_intervals(std::move(parts));
}

std::string RangeSet::to_string() const {
    if (intervals_.empty()) return "";
    std::string s;
    for (size_t i = 0; i < intervals_.size(); ++i) {
        if (i > 0) s += " || ";
        s += intervals_[i].to_string();
    }
    return s;
}

// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------

static const char* const k_operators[] = {
    ">=", "<=", "!=", "~>", ">", "<", "=", "~", "^"
};

static bool is_operator_char(char c) {
    return std::strchr("=!<>~^", c) != nullptr;
}

static std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t");
    return s.substr(b, e - b + 1);
}

// Splits a conjunction on commas and whitespace, gluing a bare operator
// (">= 1.0") to the operand that follows it.
static Result<std::vector<std::string>> tokenize(const std::string& s) {
    std::vector<std::string> raw;
    std::string cur;
    for (char c : s) {
        if (c == ',' || c == ' ' || c == '\t') {
            if (!cur.empty()) raw.push_back(std::move(cur));
            cur.clear();
        } else {
            cur += c;
        }
    }
    if (!cur.empty()) raw.push_back(std::move(cur));

    std::vector<std::string> tokens;
    for (size_t i = 0; i < raw.size(); ++i) {
        bool op_only = std::all_of(raw[i].begin(), raw[i].end(), is_operator_char);
        if (op_only) {
            if (i + 1 >= raw.size()) {
                return WeftError{WeftError::Range,
                    "operator '" + raw[i] + "' has no version in '" + s + "'"};
            }
            tokens.push_back(raw[i] + raw[i + 1]);
            ++i;
        } else {
            tokens.push_back(raw[i]);
        }
    }
    return Result<std::vector<std::string>>::ok(std::move(tokens));
}

static Result<RangeSet> parse_term(const std::string& term) {
    std::string op;
    for (const char* candidate : k_operators) {
        if (term.compare(0, std::strlen(candidate), candidate) == 0) {
            op = candidate;
            break;
        }
    }
    if (op.empty() && !term.empty() && is_operator_char(term[0])) {
        return WeftError{WeftError::Range,
            "unknown operator in '" + term + "'"};
    }

    auto parsed = PartialVersion::parse(term.substr(op.size()));
    if (parsed.is_err()) return std::move(parsed).error();
    const PartialVersion& pv = parsed.value();

    if (pv.is_wildcard()) {
        if (op == ">" || op == "<" || op == "!=") return Result<RangeSet>::ok(RangeSet{});
        return Result<RangeSet>::ok(RangeSet::everything());
    }

    SemVer lo = pv.floor();
    std::optional<SemVer> end = pv.block_end();
    std::vector<Interval> out;

    if (op.empty() || op == "=") {
        out.push_back(pv.is_full() ? Interval::point(lo) : up_to(lo, end));
    } else if (op == "!=") {
        out.push_back(Interval::less_than(lo));
        if (pv.is_full()) {
            out.push_back(Interval::greater_than(lo));
        } else if (end) {
            out.push_back(Interval::at_least(*end));
        }
    } else if (op == ">") {
        if (pv.is_full()) {
            out.push_back(Interval::greater_than(lo));
        } else if (end) {
            out.push_back(Interval::at_least(*end));
        }
    } else if (op == ">=") {
        out.push_back(Interval::at_least(lo));
    } else if (op == "<") {
        out.push_back(Interval::less_than(lo));
    } else if (op == "<=") {
        out.push_back(pv.is_full() ? Interval::at_most(lo) : up_to(std::nullopt, end));
    } else if (op == "~" || op == "~>") {
        // ~1.2.3 := >=1.2.3, <1.3.0 and ~1 := >=1.0.0, <2.0.0
        out.push_back(up_to(lo, next_release(lo, pv.minor < 0 ? 1 : 2)));
    } else if (op == "^") {
        // Up to the next change of the leftmost non-zero component
        int depth = 3;
        if (pv.major > 0 || pv.minor < 0) {
            depth = 1;
        } else if (pv.minor > 0 || pv.patch < 0) {
            depth = 2;
        }
        out.push_back(up_to(lo, next_release(lo, depth)));
    }

    return Result<RangeSet>::ok(RangeSet::from_intervals(std::move(out)));
}

// "A - B": inclusive on both ends, with a partial B covering its whole block
static Result<RangeSet> parse_hyphen(const std::string& from, const std::string& to) {
    auto a = PartialVersion::parse(from);
    if (a.is_err()) return std::move(a).error();
    auto b = PartialVersion::parse(to);
    if (b.is_err()) return std::move(b).error();

    Interval span;
    if (!a.value().is_wildcard()) {
        span.lower = Bound{a.value().floor(), true};
    }
    if (b.value().is_full()) {
        span.upper = Bound{b.value().floor(), true};
    } else if (auto end = b.value().block_end()) {
        span.upper = Bound{std::move(*end), false};
    }
    return Result<RangeSet>::ok(RangeSet::from_intervals({span}));
}

static Result<RangeSet> parse_conjunction(const std::string& s) {
    auto tokens_r = tokenize(s);
    if (tokens_r.is_err()) return std::move(tokens_r).error();
    const auto& tokens = tokens_r.value();

    if (tokens.empty()) {
        return WeftError{WeftError::Range, "empty range alternative"};
    }

    RangeSet acc = RangeSet::everything();
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (i + 2 < tokens.size() && tokens[i + 1] == "-") {
            auto span = parse_hyphen(tokens[i], tokens[i + 2]);
            if (span.is_err()) return std::move(span).error();
            acc = acc.intersect(span.value());
            i += 2;
            continue;
        }
        auto term = parse_term(tokens[i]);
        if (term.is_err()) return std::move(term).error();
        acc = acc.intersect(term.value());
    }
    return Result<RangeSet>::ok(std::move(acc));
}

Result<RangeSet> RangeSet::parse(const std::string& s) {
    std::string text = trim(s);
    if (text.empty()) {
        return WeftError{WeftError::Range, "empty range expression"};
    }

    RangeSet result;
    size_t start = 0;
    while (true) {
        size_t bar = text.find("||", start);
        std::string alt = text.substr(start, bar == std::string::npos ? std::string::npos
                                                                       : bar - start);
        auto parsed = parse_conjunction(alt);
        if (parsed.is_err()) {
            auto err = std::move(parsed).error();
            err.message = "invalid range '" + text + "': " + err.message;
            return err;
        }
        result = result.unite(parsed.value());

        if (bar == std::string::npos) break;
        start = bar + 2;
    }

    return Result<RangeSet>::ok(std::move(result));
}

} // namespace weft

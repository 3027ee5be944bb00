#include "urlpath/url_path.h"
#include "co/str.h"

namespace urlpath {
namespace xx {

inline bool is_dot(const fastring& s) {
    return s.size() == 1 && s[0] == '.';
}

inline bool is_dotdot(const fastring& s) {
    return s.size() == 2 && s[0] == '.' && s[1] == '.';
}

inline bool starts_with_nocase(const char* s, size_t n, const char* p, size_t m) {
    if (n < m) return false;
    for (size_t i = 0; i < m; ++i) {
        char c = s[i];
        if ('A' <= c && c <= 'Z') c ^= 32;
        if (c != p[i]) return false;
    }
    return true;
}

} // xx

co::vector<fastring> split_segments(const char* s, size_t n) {
    co::vector<fastring> v;
    if (n == 0) {
        v.emplace_back();
        return v;
    }

    // str::split() drops the element after a trailing separator, keep it here
    v = str::split(s, n, '/');
    if (s[n - 1] == '/') v.emplace_back();
    return v;
}

co::vector<fastring> resolve_segments(const co::vector<fastring>& segs, bool absolute) {
    co::vector<fastring> r;
    r.reserve(segs.size());

    for (const auto& s : segs) {
        if (s.empty() || xx::is_dot(s)) continue;

        if (xx::is_dotdot(s)) {
            if (!r.empty() && !xx::is_dotdot(r.back())) {
                r.remove_back();
            } else if (!absolute) {
                // nothing to go back to, keep it in a relative path
                r.push_back(s);
            }
            continue;
        }

        r.push_back(s);
    }

    return r;
}

fastring join_segments(const co::vector<fastring>& segs, bool absolute, bool trailing) {
    size_t n = segs.size() + 1;
    for (const auto& s : segs) n += s.size();

    fastring r(n + 1);
    if (absolute) r.append('/');
    for (size_t i = 0; i < segs.size(); ++i) {
        if (i > 0) r.append('/');
        r.append(segs[i]);
    }
    if (trailing && !segs.empty()) r.append('/');

    if (r.empty()) r.append('.');
    return r;
}

fastring normalize(const char* s, size_t n) {
    const bool absolute = is_absolute(s, n);
    const bool trailing = has_trailing_slash(s, n);
    return join_segments(
        resolve_segments(split_segments(s, n), absolute), absolute, trailing
    );
}

bool is_external(const char* s, size_t n) {
    return xx::starts_with_nocase(s, n, "http:", 5) || xx::starts_with_nocase(s, n, "https:", 6);
}

co::vector<fastring> UrlPath::segments() const {
    return resolve_segments(split_segments(_s), this->is_absolute());
}

fastring UrlPath::last() const {
    co::vector<fastring> v = this->segments();
    return !v.empty() ? v.back() : fastring();
}

fastring UrlPath::parent() const {
    co::vector<fastring> v = this->segments();
    if (v.empty()) return fastring();

    v.remove_back();
    if (v.empty() && !this->is_absolute()) return fastring();
    return join_segments(v, this->is_absolute(), false);
}

} // namespace urlpath

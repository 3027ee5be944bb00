#pragma once

#include "def.h"
#include "co/fastring.h"
#include "co/vector.h"

// Manipulate url paths as plain text. Nothing is looked up on the disk or the
// network, so the path does not have to exist anywhere.
// The separator is always '/'.

namespace urlpath {

// Return the canonical form of a url path.
//   - empty elements and "." elements are removed
//   - ".." removes the previous element; at the root of an absolute path it is
//     dropped, in a relative path with nothing to remove it is kept
//   - a trailing '/' is kept if there is an element to attach it to
//   - an empty relative result is "."
//
//   - urlpath::normalize("");                          ->  "."
//   - urlpath::normalize("/");                         ->  "/"
//   - urlpath::normalize("a//b///c");                  ->  "a/b/c"
//   - urlpath::normalize("a/b/");                      ->  "a/b/"
//   - urlpath::normalize("/a/b/../c");                 ->  "/a/c"
//   - urlpath::normalize("../../x");                   ->  "../../x"
//   - urlpath::normalize("src/md/./../../README.md");  ->  "README.md"
__upapi fastring normalize(const char* s, size_t n);

inline fastring normalize(const char* s) {
    return normalize(s, strlen(s));
}

inline fastring normalize(const fastring& s) {
    return normalize(s.data(), s.size());
}

inline fastring normalize(const std::string& s) {
    return normalize(s.data(), s.size());
}

// Split the path on '/'. Empty elements are kept, so the result has one
// element more than the number of separators.
//   - urlpath::split_segments("");       ->  [ "" ]
//   - urlpath::split_segments("/a//b/"); ->  [ "", "a", "", "b", "" ]
__upapi co::vector<fastring> split_segments(const char* s, size_t n);

inline co::vector<fastring> split_segments(const char* s) {
    return split_segments(s, strlen(s));
}

inline co::vector<fastring> split_segments(const fastring& s) {
    return split_segments(s.data(), s.size());
}

inline co::vector<fastring> split_segments(const std::string& s) {
    return split_segments(s.data(), s.size());
}

// Fold "." and ".." into the segments, left to right. Empty segments are
// dropped. The result never contains "" or ".", and contains ".." only at
// the front of a relative path.
__upapi co::vector<fastring> resolve_segments(const co::vector<fastring>& segs, bool absolute);

// Join resolved segments into a path string.
//   - a leading '/' is added if @absolute is true
//   - a trailing '/' is added if @trailing is true and @segs is not empty
//   - empty relative result becomes "."
__upapi fastring join_segments(const co::vector<fastring>& segs, bool absolute, bool trailing);

inline bool is_absolute(const char* s, size_t n) {
    return n > 0 && s[0] == '/';
}

inline bool is_absolute(const char* s) { return s[0] == '/'; }
inline bool is_absolute(const fastring& s) { return s.starts_with('/'); }
inline bool is_absolute(const std::string& s) { return !s.empty() && s[0] == '/'; }

// true if the path ends with '/' and is not "/" itself
inline bool has_trailing_slash(const char* s, size_t n) {
    return n > 1 && s[n - 1] == '/';
}

inline bool has_trailing_slash(const char* s) {
    return has_trailing_slash(s, strlen(s));
}

inline bool has_trailing_slash(const fastring& s) {
    return has_trailing_slash(s.data(), s.size());
}

inline bool has_trailing_slash(const std::string& s) {
    return has_trailing_slash(s.data(), s.size());
}

// true if the string is a link to another site, i.e. it starts with "http:"
// or "https:" (case insensitive). Nothing else of the url is checked.
__upapi bool is_external(const char* s, size_t n);

inline bool is_external(const char* s) {
    return is_external(s, strlen(s));
}

inline bool is_external(const fastring& s) {
    return is_external(s.data(), s.size());
}

inline bool is_external(const std::string& s) {
    return is_external(s.data(), s.size());
}

namespace xx {
inline void append(fastring&) {}

inline void append_one(fastring& f, const char* s, size_t n) {
    if (n == 0) return;
    if (!f.empty() && f.back() != '/') f.append('/');
    f.append(s, n);
}

inline void append_one(fastring& f, const char* s) { append_one(f, s, strlen(s)); }
inline void append_one(fastring& f, const fastring& s) { append_one(f, s.data(), s.size()); }
inline void append_one(fastring& f, const std::string& s) { append_one(f, s.data(), s.size()); }

template<typename S, typename ...X>
inline void append(fastring& f, S&& s, X&&... x) {
    append_one(f, std::forward<S>(s));
    append(f, std::forward<X>(x)...);
}
} // namespace xx

// Join any number of path elements with '/'. Empty elements are ignored, the
// result is normalized. If all elements are empty, the result is empty.
//   - urlpath::join("", "");            ->  ""
//   - urlpath::join("/x", "y");         ->  "/x/y"
//   - urlpath::join("/x/", "../y/");    ->  "/y/"
//   - urlpath::join("a", "..", "..");   ->  ".."
template<typename ...S>
inline fastring join(S&&... s) {
    fastring v(64);
    xx::append(v, std::forward<S>(s)...);
    return !v.empty() ? normalize(v) : v;
}

// UrlPath holds a path as it was given. Every query works on the stored text,
// which is never modified.
//
// An external link ("http:..." or "https:...") is not special here, it is
// normalized like any other path:  "https://x.com//a" -> "https:/x.com/a".
// Check is_external() first if such links must be kept as they are.
//
//   urlpath::UrlPath p("/home/user/md/../../README.md");
//   p.normalize();  // "/home/README.md"
//   p.parent();     // "/home"
//   p.last();       // "README.md"
class __upapi UrlPath {
  public:
    UrlPath() = default;
    ~UrlPath() = default;

    explicit UrlPath(const char* s) : _s(s) {}
    UrlPath(const char* s, size_t n) : _s(s, n) {}
    explicit UrlPath(const fastring& s) : _s(s) {}
    explicit UrlPath(fastring&& s) : _s(std::move(s)) {}
    explicit UrlPath(const std::string& s) : _s(s) {}

    UrlPath(const UrlPath&) = default;
    UrlPath(UrlPath&&) = default;
    UrlPath& operator=(const UrlPath&) = default;
    UrlPath& operator=(UrlPath&&) = default;

    // the input as given
    const fastring& str() const { return _s; }

    bool is_absolute() const { return urlpath::is_absolute(_s); }

    bool has_trailing_slash() const { return urlpath::has_trailing_slash(_s); }

    bool is_external() const { return urlpath::is_external(_s); }

    // the canonical path, see urlpath::normalize()
    fastring normalize() const { return urlpath::normalize(_s); }

    // the resolved segments of the path
    co::vector<fastring> segments() const;

    // the last resolved segment, or empty if there is none
    //   - "/a/b/../c" -> "c",  "/" -> "",  "../.." -> ".."
    fastring last() const;

    // the normalized path without its last segment, or empty if there is no
    // parent. An absolute path keeps its leading '/'.
    //   - "/a/b" -> "/a",  "/a" -> "/",  "a" -> "",  "../x" -> ".."
    fastring parent() const;

  private:
    fastring _s;
};

// two paths are equal if their normalized forms are equal
inline bool operator==(const UrlPath& a, const UrlPath& b) {
    return a.normalize() == b.normalize();
}

inline bool operator!=(const UrlPath& a, const UrlPath& b) {
    return !(a == b);
}

} // namespace urlpath

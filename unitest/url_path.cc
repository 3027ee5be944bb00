#include "co/unitest.h"
#include "co/path.h"
#include "urlpath/url_path.h"

namespace test {

DEF_test(url_path) {
    DEF_case(normalize) {
        EXPECT_EQ(urlpath::normalize("src/md/./../../README.md"), "README.md");
        EXPECT_EQ(urlpath::normalize("./README.md"), "README.md");
        EXPECT_EQ(urlpath::normalize("md/README.md"), "md/README.md");
        EXPECT_EQ(urlpath::normalize("md/more/../README.md"), "md/README.md");
        EXPECT_EQ(urlpath::normalize("md/../README.md"), "README.md");
        EXPECT_EQ(urlpath::normalize("/a/b/../c"), "/a/c");
        EXPECT_EQ(urlpath::normalize("/home/user/md/README.md"), "/home/user/md/README.md");
        EXPECT_EQ(urlpath::normalize("/home/user/md/../../README.md"), "/home/README.md");
        EXPECT_EQ(urlpath::normalize("a//b///c"), "a/b/c");
        EXPECT_EQ(urlpath::normalize("a/./b/."), "a/b");
        EXPECT_EQ(urlpath::normalize("README.md"), "README.md");
    }

    DEF_case(empty_and_root) {
        EXPECT_EQ(urlpath::normalize(""), ".");
        EXPECT_EQ(urlpath::normalize("."), ".");
        EXPECT_EQ(urlpath::normalize("./"), ".");
        EXPECT_EQ(urlpath::normalize("./."), ".");
        EXPECT_EQ(urlpath::normalize("a/.."), ".");
        EXPECT_EQ(urlpath::normalize("a/../"), ".");
        EXPECT_EQ(urlpath::normalize("/"), "/");
        EXPECT_EQ(urlpath::normalize("//"), "/");
        EXPECT_EQ(urlpath::normalize("///"), "/");
        EXPECT_EQ(urlpath::normalize("/."), "/");
        EXPECT_EQ(urlpath::normalize("/a/.."), "/");
        EXPECT_EQ(urlpath::normalize("/a/../"), "/");
        EXPECT_EQ(urlpath::normalize(fastring()), ".");
        EXPECT_EQ(urlpath::normalize(std::string()), ".");
    }

    DEF_case(dotdot) {
        EXPECT_EQ(urlpath::normalize(".."), "..");
        EXPECT_EQ(urlpath::normalize("../"), "../");
        EXPECT_EQ(urlpath::normalize("../../x"), "../../x");
        EXPECT_EQ(urlpath::normalize("../../README.md"), "../../README.md");
        EXPECT_EQ(urlpath::normalize("./x/../.."), "..");
        EXPECT_EQ(urlpath::normalize("./x/../../.."), "../..");
        EXPECT_EQ(urlpath::normalize("a/../../b"), "../b");
        EXPECT_EQ(urlpath::normalize("../a/../b"), "../b");
        EXPECT_EQ(urlpath::normalize("a/b/../../../c/d"), "../c/d");

        // can't go above the root of an absolute path
        EXPECT_EQ(urlpath::normalize("/.."), "/");
        EXPECT_EQ(urlpath::normalize("/../.."), "/");
        EXPECT_EQ(urlpath::normalize("/../x"), "/x");
        EXPECT_EQ(urlpath::normalize("/x/../../y"), "/y");
        EXPECT_EQ(urlpath::normalize("/x/./../."), "/");
    }

    DEF_case(trailing_slash) {
        EXPECT_EQ(urlpath::normalize("a/b/"), "a/b/");
        EXPECT_EQ(urlpath::normalize("a/b//"), "a/b/");
        EXPECT_EQ(urlpath::normalize("a/b/./"), "a/b/");
        EXPECT_EQ(urlpath::normalize("a/b/c/../"), "a/b/");
        EXPECT_EQ(urlpath::normalize("/a/"), "/a/");
        EXPECT_EQ(urlpath::normalize("../../"), "../../");
        EXPECT_EQ(urlpath::normalize("a/b/."), "a/b");
        EXPECT_EQ(urlpath::normalize("a/b/.."), "a");
    }

    DEF_case(idempotent) {
        const char* paths[] = {
            "", "/", "//", ".", "..", "./", "../", "a", "a/", "/a/", "a//b", "/a/./b/../c/",
            "../../x", "x/../../..", "/../..", "src/md/./../../README.md", "a/b/c/../../d//",
        };
        for (size_t i = 0; i < sizeof(paths) / sizeof(paths[0]); ++i) {
            fastring x = urlpath::normalize(paths[i]);
            EXPECT_EQ(urlpath::normalize(x), x);
        }
    }

    DEF_case(canonical) {
        EXPECT_EQ(urlpath::normalize("a/b/c"), "a/b/c");
        EXPECT_EQ(urlpath::normalize("/a/b/c"), "/a/b/c");
        EXPECT_EQ(urlpath::normalize("/a/b/c/"), "/a/b/c/");
        EXPECT_EQ(urlpath::normalize("a.b/..c/c.."), "a.b/..c/c..");
        EXPECT_EQ(urlpath::normalize("/.../x"), "/.../x");
        EXPECT_EQ(urlpath::normalize("a:b/c%2F../d"), "a:b/c%2F../d");
    }

    DEF_case(absolute_has_no_dotdot) {
        const char* paths[] = {
            "/..", "/../a/..", "/a/../../b/../../..", "/./../", "//..//..//x",
        };
        for (size_t i = 0; i < sizeof(paths) / sizeof(paths[0]); ++i) {
            fastring x = urlpath::normalize(paths[i]);
            EXPECT(x.starts_with('/'));
            EXPECT(!x.contains(".."));
        }
    }

    DEF_case(external) {
        urlpath::UrlPath e("https://x.com//a");
        EXPECT(e.is_external());
        EXPECT_EQ(e.normalize(), "https:/x.com/a");
        EXPECT_EQ(e.last(), "a");
        EXPECT_EQ(e.parent(), "https:/x.com");
        EXPECT_EQ(e.str(), "https://x.com//a");

        EXPECT_EQ(urlpath::normalize("http://x.com/a/../b/"), "http:/x.com/b/");
        EXPECT_EQ(urlpath::normalize("HTTP://x.com/./"), "HTTP:/x.com/");
    }

    // without a trailing slash, the result is what path::clean() gives
    DEF_case(same_as_path_clean) {
        const char* paths[] = {
            "", ".", "..", "/", "//x", "a/b/../c", "./x/../..", "/x/../..", "a//b///c",
            "/a/./b/../../../c", "../../x", "x/./y/..", "src/md/./../../README.md",
        };
        for (size_t i = 0; i < sizeof(paths) / sizeof(paths[0]); ++i) {
            EXPECT_EQ(urlpath::normalize(paths[i]), path::clean(paths[i]));
        }
    }

    DEF_case(split_segments) {
        auto v = urlpath::split_segments("");
        EXPECT_EQ(v.size(), 1);
        EXPECT_EQ(v[0], "");

        v = urlpath::split_segments("a");
        EXPECT_EQ(v.size(), 1);
        EXPECT_EQ(v[0], "a");

        v = urlpath::split_segments("/");
        EXPECT_EQ(v.size(), 2);
        EXPECT_EQ(v[0], "");
        EXPECT_EQ(v[1], "");

        v = urlpath::split_segments("/a//b/");
        EXPECT_EQ(v.size(), 5);
        EXPECT_EQ(v[0], "");
        EXPECT_EQ(v[1], "a");
        EXPECT_EQ(v[2], "");
        EXPECT_EQ(v[3], "b");
        EXPECT_EQ(v[4], "");

        v = urlpath::split_segments(fastring("x/./.."));
        EXPECT_EQ(v.size(), 3);
        EXPECT_EQ(v[1], ".");
        EXPECT_EQ(v[2], "..");
    }

    DEF_case(resolve_segments) {
        auto v = urlpath::resolve_segments(urlpath::split_segments("a/./b/../../../c"), false);
        EXPECT_EQ(v.size(), 2);
        EXPECT_EQ(v[0], "..");
        EXPECT_EQ(v[1], "c");

        v = urlpath::resolve_segments(urlpath::split_segments("/a/./b/../../../c"), true);
        EXPECT_EQ(v.size(), 1);
        EXPECT_EQ(v[0], "c");

        v = urlpath::resolve_segments(urlpath::split_segments("../.."), false);
        EXPECT_EQ(v.size(), 2);
        EXPECT_EQ(v[0], "..");
        EXPECT_EQ(v[1], "..");

        v = urlpath::resolve_segments(urlpath::split_segments("//./"), true);
        EXPECT(v.empty());
    }

    DEF_case(join_segments) {
        co::vector<fastring> v;
        EXPECT_EQ(urlpath::join_segments(v, false, false), ".");
        EXPECT_EQ(urlpath::join_segments(v, false, true), ".");
        EXPECT_EQ(urlpath::join_segments(v, true, false), "/");
        EXPECT_EQ(urlpath::join_segments(v, true, true), "/");

        v.push_back("a");
        v.push_back("b");
        EXPECT_EQ(urlpath::join_segments(v, false, false), "a/b");
        EXPECT_EQ(urlpath::join_segments(v, false, true), "a/b/");
        EXPECT_EQ(urlpath::join_segments(v, true, false), "/a/b");
        EXPECT_EQ(urlpath::join_segments(v, true, true), "/a/b/");
    }

    DEF_case(predicates) {
        EXPECT(urlpath::is_absolute("/"));
        EXPECT(urlpath::is_absolute("/a"));
        EXPECT(!urlpath::is_absolute(""));
        EXPECT(!urlpath::is_absolute("a/b"));
        EXPECT(!urlpath::is_absolute(fastring()));
        EXPECT(!urlpath::is_absolute(std::string("./a")));

        EXPECT(urlpath::has_trailing_slash("a/"));
        EXPECT(urlpath::has_trailing_slash("//"));
        EXPECT(!urlpath::has_trailing_slash("/"));
        EXPECT(!urlpath::has_trailing_slash(""));
        EXPECT(!urlpath::has_trailing_slash("a/b"));

        EXPECT(urlpath::is_external("http://example.com/a"));
        EXPECT(urlpath::is_external("https://raw.githubusercontent.com/ivanceras/svgbob/master/TODO.md"));
        EXPECT(urlpath::is_external("HTTPS://x"));
        EXPECT(!urlpath::is_external("http"));
        EXPECT(!urlpath::is_external("ftp://x"));
        EXPECT(!urlpath::is_external("/http:/x"));
        EXPECT(!urlpath::is_external(""));
    }

    DEF_case(join) {
        EXPECT_EQ(urlpath::join(""), "");
        EXPECT_EQ(urlpath::join("", ""), "");
        EXPECT_EQ(urlpath::join("", "x"), "x");
        EXPECT_EQ(urlpath::join("x", ""), "x");
        EXPECT_EQ(urlpath::join("", "/x"), "/x");
        EXPECT_EQ(urlpath::join("/x", "y"), "/x/y");
        EXPECT_EQ(urlpath::join("/x/", "y"), "/x/y");
        EXPECT_EQ(urlpath::join("/x/", "y", "z/"), "/x/y/z/");
        EXPECT_EQ(urlpath::join("/x/", "../y/"), "/y/");
        EXPECT_EQ(urlpath::join("a", "..", ".."), "..");
        EXPECT_EQ(urlpath::join("x", fastring("y"), std::string("z")), "x/y/z");
    }

    DEF_case(url_path) {
        urlpath::UrlPath p("/home/user/md/../../README.md");
        EXPECT_EQ(p.str(), "/home/user/md/../../README.md");
        EXPECT(p.is_absolute());
        EXPECT(!p.is_external());
        EXPECT(!p.has_trailing_slash());
        EXPECT_EQ(p.normalize(), "/home/README.md");
        EXPECT_EQ(p.normalize(), "/home/README.md");
        EXPECT_EQ(p.parent(), "/home");
        EXPECT_EQ(p.last(), "README.md");

        urlpath::UrlPath q(std::string("md/../README.md"));
        EXPECT(!q.is_absolute());
        EXPECT_EQ(q.normalize(), "README.md");
        EXPECT_EQ(q.last(), "README.md");
        EXPECT_EQ(q.parent(), "");

        urlpath::UrlPath e("https://raw.githubusercontent.com/ivanceras/svgbob/master/TODO.md");
        EXPECT(e.is_external());
        EXPECT(!e.is_absolute());

        urlpath::UrlPath x(fastring("a/b/"));
        EXPECT(x.has_trailing_slash());
        EXPECT_EQ(x.normalize(), "a/b/");

        urlpath::UrlPath y("x/y/", 2);
        EXPECT_EQ(y.str(), "x/");
        EXPECT_EQ(y.normalize(), "x/");
    }

    DEF_case(parent_and_last) {
        EXPECT_EQ(urlpath::UrlPath("/a/b").parent(), "/a");
        EXPECT_EQ(urlpath::UrlPath("/a/b").last(), "b");
        EXPECT_EQ(urlpath::UrlPath("/a").parent(), "/");
        EXPECT_EQ(urlpath::UrlPath("/a").last(), "a");
        EXPECT_EQ(urlpath::UrlPath("/").parent(), "");
        EXPECT_EQ(urlpath::UrlPath("/").last(), "");
        EXPECT_EQ(urlpath::UrlPath("").parent(), "");
        EXPECT_EQ(urlpath::UrlPath("").last(), "");
        EXPECT_EQ(urlpath::UrlPath("a").parent(), "");
        EXPECT_EQ(urlpath::UrlPath("a/b/c/").parent(), "a/b");
        EXPECT_EQ(urlpath::UrlPath("a/b/c/").last(), "c");
        EXPECT_EQ(urlpath::UrlPath("/a/b/../c").last(), "c");
        EXPECT_EQ(urlpath::UrlPath("../x").parent(), "..");
        EXPECT_EQ(urlpath::UrlPath("../..").last(), "..");
        EXPECT_EQ(urlpath::UrlPath("../..").parent(), "..");
    }

    DEF_case(equality) {
        EXPECT(urlpath::UrlPath("a/./b") == urlpath::UrlPath("a//b"));
        EXPECT(urlpath::UrlPath("/x/../y") == urlpath::UrlPath("/y"));
        EXPECT(urlpath::UrlPath("a/b/") != urlpath::UrlPath("a/b"));
        EXPECT(urlpath::UrlPath("/a") != urlpath::UrlPath("a"));
    }
}

} // namespace test

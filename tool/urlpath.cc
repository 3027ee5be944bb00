#include "co/flag.h"
#include "co/log.h"
#include "co/cout.h"
#include "urlpath/url_path.h"

#include <stdio.h>
#include <string.h>

DEF_bool(details, false, "also print absolute, external, parent and last of each path", d);
DEF_bool(skip_external, false, "print http: and https: links unchanged");

void print_path(const fastring& s) {
    urlpath::UrlPath p(s);
    fastring r = (FLG_skip_external && p.is_external()) ? s : p.normalize();
    DLOG << "normalize " << s << " -> " << r;

    if (!FLG_details) {
        cout << r << '\n';
        return;
    }

    cout << r << '\t'
         << "absolute=" << (p.is_absolute() ? "true" : "false") << '\t'
         << "external=" << (p.is_external() ? "true" : "false") << '\t'
         << "parent=" << p.parent() << '\t'
         << "last=" << p.last() << '\n';
}

// "k=v" sets flag k if there is one, otherwise it is a path.
bool set_flag_arg(const char* arg) {
    const char* const p = strchr(arg, '=');
    fastring k(arg, p - arg);
    fastring e = flag::set_value(k.c_str(), fastring(p + 1));
    if (e.empty()) return true;
    if (e.starts_with("flag not defined")) return false;
    cout << e << endl;
    ::exit(1);
}

// Paths are taken from the command line in order. Everything after "--" is a
// path, and so is "k=v" when k is not a flag. The rest goes to flag::parse().
co::vector<fastring> parse_args(int argc, char** argv) {
    co::vector<char*> args(argc + 1);
    co::vector<int> held(8);
    int end = argc;

    args.push_back(argv[0]);
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--") == 0 && i + 1 < argc) { end = i; break; }
        if (argv[i][0] != '-' && strchr(argv[i], '=')) {
            held.push_back(i);
            continue;
        }
        args.push_back(argv[i]);
    }

    co::vector<fastring> v = flag::parse((int)args.size(), args.data());

    co::vector<fastring> paths(argc + 1);
    size_t h = 0, k = 0;
    for (int i = 1; i < end; ++i) {
        if (h < held.size() && held[h] == i) {
            ++h;
            if (!set_flag_arg(argv[i])) paths.push_back(fastring(argv[i]));
        } else if (k < v.size() && v[k] == argv[i]) {
            paths.push_back(v[k++]);
        }
    }
    for (int i = end + 1; i < argc; ++i) paths.push_back(fastring(argv[i]));
    return paths;
}

int main(int argc, char** argv) {
    co::vector<fastring> v = parse_args(argc, argv);

    if (!v.empty()) {
        for (size_t i = 0; i < v.size(); ++i) print_path(v[i]);
        cout.flush();
        return 0;
    }

    // no path on the command line, read one path per line from stdin
    LOG << "reading paths from stdin";
    fastring line(256);
    char buf[4096];
    size_t n = 0;
    while (fgets(buf, sizeof(buf), stdin)) {
        line.append(buf);
        if (!line.ends_with('\n') && !feof(stdin)) continue;
        line.trim("\r\n", 'r');
        print_path(line);
        line.clear();
        ++n;
    }

    if (ferror(stdin)) {
        ELOG << "read stdin failed after " << n << " lines";
        return 1;
    }

    LOG << n << " paths normalized";
    cout.flush();
    return 0;
}

#ifndef TEMP_DIR_HPP
#define TEMP_DIR_HPP

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <ftw.h>
#include <iterator>
#include <string>
#include <unistd.h>

// Scratch directory removed with everything in it on destruction
class TempDir {
public:
    TempDir() {
        char tmpl[] = "/tmp/anemo_test_XXXXXX";
        const char* made = ::mkdtemp(tmpl);
        dir = made != nullptr ? made : "";
    }

    ~TempDir() {
        if (!dir.empty()) {
            (void)::nftw(dir.c_str(), removeEntry, 16, FTW_DEPTH | FTW_PHYS);
        }
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    bool valid() const { return !dir.empty(); }
    std::string path(const std::string& name) const { return dir + "/" + name; }

    static std::string readFile(const std::string& file) {
        std::ifstream in(file.c_str(), std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    static bool exists(const std::string& file) { return ::access(file.c_str(), F_OK) == 0; }

private:
    static int removeEntry(const char* fpath, const struct stat* sb, int typeflag, struct FTW* ftwbuf) {
        (void)sb;
        (void)typeflag;
        (void)ftwbuf;
        return std::remove(fpath);
    }

    std::string dir;
};

#endif // TEMP_DIR_HPP

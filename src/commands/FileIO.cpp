#include "FileIO.h"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iterator>
#include "errors/Errors.h"

namespace commands {

std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw errors::FileIOError(path, std::string("cannot open file (") + std::strerror(errno) + ")");
    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) throw errors::FileIOError(path, "read failed");
    return data;
}

void write_file_atomic(const std::string& path, const std::string& content) {
    const std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) throw errors::FileIOError(tmp, std::string("cannot create file (") + std::strerror(errno) + ")");
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            out.close();
            std::remove(tmp.c_str());
            throw errors::FileIOError(tmp, "write failed");
        }
    }
    if (std::rename(tmp.c_str(), path.c_str()) != 0) {
        int err = errno;
        std::remove(tmp.c_str());
        throw errors::FileIOError(path, std::string("cannot replace file (") + std::strerror(err) + ")");
    }
}

}

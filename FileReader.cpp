#include "FileReader.h"
#include <zlib.h>
#include <fstream>
#include <stdexcept>

namespace Aapc {

namespace {
    bool hasGzipSuffix(const std::string& filepath) {
        return filepath.size() > 3 && filepath.substr(filepath.size() - 3) == ".gz";
    }
}

// The actual implementation is hidden inside this struct.
struct FileReader::FileReaderImpl {
    std::string path;
    gzFile gz_file = nullptr;
    std::ifstream regular_file;
    bool is_gzipped = false;

    ~FileReaderImpl() {
        if (gz_file) {
            gzclose(gz_file);
        }
    }
};

FileReader::FileReader(const std::string& filepath)
    : pimpl_(std::make_unique<FileReaderImpl>()) {
    pimpl_->path = filepath;

    if (hasGzipSuffix(filepath)) {
        pimpl_->is_gzipped = true;
        pimpl_->gz_file = gzopen(filepath.c_str(), "rb");
        if (!pimpl_->gz_file) {
            throw std::runtime_error("FileReader Error: Cannot open gzipped file: " + filepath);
        }
    } else {
        pimpl_->regular_file.open(filepath, std::ios::binary);
        if (!pimpl_->regular_file.is_open()) {
            throw std::runtime_error("FileReader Error: Cannot open file: " + filepath);
        }
    }
}

FileReader::~FileReader() = default;

bool FileReader::is_open() const {
    if (!pimpl_) return false;
    return pimpl_->is_gzipped ? (pimpl_->gz_file != nullptr) : pimpl_->regular_file.is_open();
}

bool FileReader::is_gzipped() const {
    return pimpl_ && pimpl_->is_gzipped;
}

ByteBuffer FileReader::readAll() {
    if (!is_open()) {
        throw std::runtime_error("FileReader Error: File is not open: " + pimpl_->path);
    }

    // Sizes are never taken from the file system: pipes, FIFOs and /proc
    // entries report no usable length, so both branches read until EOF.
    const std::size_t BUFFER_SIZE = 64 * 1024;
    unsigned char buffer[BUFFER_SIZE];
    ByteBuffer contents;
    if (pimpl_->is_gzipped) {
        while (true) {
            const int n = gzread(pimpl_->gz_file, buffer, static_cast<unsigned int>(BUFFER_SIZE));
            if (n < 0) {
                int errnum = 0;
                const char* message = gzerror(pimpl_->gz_file, &errnum);
                throw std::runtime_error("FileReader Error: " + std::string(message) + ": " + pimpl_->path);
            }
            if (n == 0) break;
            contents.insert(contents.end(), buffer, buffer + n);
        }
    } else {
        std::ifstream& file = pimpl_->regular_file;
        while (file) {
            file.read(reinterpret_cast<char*>(buffer), static_cast<std::streamsize>(BUFFER_SIZE));
            const std::streamsize n = file.gcount();
            contents.insert(contents.end(), buffer, buffer + n);
        }
        if (file.bad() || !file.eof()) {
            throw std::runtime_error("FileReader Error: Read failed: " + pimpl_->path);
        }
    }
    return contents;
}

ByteBuffer readFile(const std::string& filepath) {
    FileReader reader(filepath);
    return reader.readAll();
}

} // namespace Aapc

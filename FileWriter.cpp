#include "FileWriter.h"
#include <zlib.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;
namespace Aapc {

struct FileWriter::FileWriterImpl {
    std::string path;
    // Bytes go to this sibling file and are renamed over `path` by close().
    std::string temp_path;
    gzFile gz_file = nullptr;
    std::ofstream regular_file;
    bool is_gzipped = false;
    bool committed = false;

    // An unfinished write leaves the destination untouched.
    ~FileWriterImpl() {
        if (gz_file) {
            gzclose(gz_file);
        }
        if (regular_file.is_open()) {
            regular_file.close();
        }
        if (!committed) {
            std::error_code ec;
            fs::remove(temp_path, ec);
        }
    }
};

FileWriter::FileWriter(const std::string& filepath)
    : pimpl_(std::make_unique<FileWriterImpl>()) {
    pimpl_->path = filepath;
    pimpl_->temp_path = filepath + ".partial";

    if (filepath.size() > 3 && filepath.substr(filepath.size() - 3) == ".gz") {
        pimpl_->is_gzipped = true;
        pimpl_->gz_file = gzopen(pimpl_->temp_path.c_str(), "wb");
        if (!pimpl_->gz_file) {
            throw std::runtime_error("FileWriter Error: Cannot create gzipped file: " + filepath);
        }
    } else {
        pimpl_->regular_file.open(pimpl_->temp_path, std::ios::binary | std::ios::trunc);
        if (!pimpl_->regular_file.is_open()) {
            throw std::runtime_error("FileWriter Error: Cannot create file: " + filepath);
        }
    }
}

FileWriter::~FileWriter() = default;

void FileWriter::write(const ByteBuffer& data) {
    if (pimpl_->committed) {
        throw std::runtime_error("FileWriter Error: File is closed: " + pimpl_->path);
    }
    if (data.empty()) return;

    if (pimpl_->is_gzipped) {
        // gzwrite takes an unsigned length, so large buffers go out in slices.
        const std::size_t SLICE = 1u << 30;
        std::size_t offset = 0;
        while (offset < data.size()) {
            const unsigned int len = static_cast<unsigned int>(std::min(SLICE, data.size() - offset));
            if (gzwrite(pimpl_->gz_file, data.data() + offset, len) != static_cast<int>(len)) {
                int errnum = 0;
                const char* message = gzerror(pimpl_->gz_file, &errnum);
                throw std::runtime_error("FileWriter Error: " + std::string(message) + ": " + pimpl_->path);
            }
            offset += len;
        }
    } else {
        pimpl_->regular_file.write(reinterpret_cast<const char*>(data.data()),
                                   static_cast<std::streamsize>(data.size()));
        if (!pimpl_->regular_file) {
            throw std::runtime_error("FileWriter Error: Write failed: " + pimpl_->path);
        }
    }
}

void FileWriter::close() {
    if (pimpl_->committed) return;

    if (pimpl_->is_gzipped) {
        const int status = gzclose(pimpl_->gz_file);
        pimpl_->gz_file = nullptr;
        if (status != Z_OK) {
            throw std::runtime_error("FileWriter Error: Cannot finish gzipped file: " + pimpl_->path);
        }
    } else {
        pimpl_->regular_file.close();
        if (pimpl_->regular_file.fail()) {
            throw std::runtime_error("FileWriter Error: Cannot flush file: " + pimpl_->path);
        }
    }

    std::error_code ec;
    fs::rename(pimpl_->temp_path, pimpl_->path, ec);
    if (ec) {
        throw std::runtime_error("FileWriter Error: Cannot move output into place: " + pimpl_->path +
                                 " (" + ec.message() + ")");
    }
    pimpl_->committed = true;
}

void writeFile(const std::string& filepath, const ByteBuffer& data) {
    FileWriter writer(filepath);
    writer.write(data);
    writer.close();
}

} // namespace Aapc

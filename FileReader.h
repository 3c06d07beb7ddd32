#ifndef AAPC_FILEREADER_H
#define AAPC_FILEREADER_H

#include <string>
#include <memory> // Required for std::unique_ptr

#include "RecordTypes.h"

namespace Aapc {

    /**
     * @class FileReader
     * @brief A unified reader for both plain and gzipped files.
     *
     * Paths ending in ".gz" are inflated through zlib while reading, so the
     * codec always sees the uncompressed bytes. Everything else is read as a
     * raw binary file.
     */
    class FileReader {
    public:
        // Opens `filepath` for binary reading, through zlib when it ends in ".gz".
        // Throws std::runtime_error if it cannot be opened.
        explicit FileReader(const std::string& filepath);
        ~FileReader();

        // Owns an open handle; not copyable.
        FileReader(const FileReader&) = delete;
        FileReader& operator=(const FileReader&) = delete;

        /**
         * @brief Reads from the current position until end of file.
         * @return The file contents. Works on unseekable inputs (pipes, FIFOs, /proc).
         * Throws std::runtime_error on a read error.
         */
        ByteBuffer readAll();

        bool is_open() const;
        bool is_gzipped() const;

    private:
        // PImpl keeps zlib out of this header.
        struct FileReaderImpl;
        std::unique_ptr<FileReaderImpl> pimpl_;
    };

    // Convenience wrapper: opens, reads and closes in one call.
    ByteBuffer readFile(const std::string& filepath);

} // namespace Aapc

#endif // AAPC_FILEREADER_H

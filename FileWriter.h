#ifndef AAPC_FILEWRITER_H
#define AAPC_FILEWRITER_H

#include <string>
#include <memory>

#include "RecordTypes.h"

namespace Aapc {

    /**
     * @class FileWriter
     * @brief Counterpart of FileReader: writes plain files, or gzip streams
     * for paths ending in ".gz".
     *
     * Bytes are written to "<path>.partial" and renamed over the destination
     * by close(). A writer destroyed before close() succeeds removes the
     * partial file, so a failed write never leaves a truncated output behind.
     */
    class FileWriter {
    public:
        // Throws std::runtime_error if the file cannot be created.
        explicit FileWriter(const std::string& filepath);
        ~FileWriter();

        FileWriter(const FileWriter&) = delete;
        FileWriter& operator=(const FileWriter&) = delete;

        // Throws std::runtime_error if not every byte could be written.
        void write(const ByteBuffer& data);
        // Finishes the stream and moves it into place. Throws std::runtime_error on failure.
        void close();

    private:
        struct FileWriterImpl;
        std::unique_ptr<FileWriterImpl> pimpl_;
    };

    // Opens, writes and closes in one call.
    void writeFile(const std::string& filepath, const ByteBuffer& data);

} // namespace Aapc

#endif // AAPC_FILEWRITER_H

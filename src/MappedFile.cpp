#include "MappedFile.hpp"
#include <filesystem>

MappedFile::MappedFile(const std::string& path)
    : filePath(path),
      fileSize(0),
      fileMapping(path.c_str(), boost::interprocess::read_only) {
    std::error_code ec;
    auto bytes = std::filesystem::file_size(path, ec);
    if (ec) {
        throw boost::interprocess::interprocess_exception(ec.message().c_str());
    }
    fileSize = bytes;
}

uint64_t MappedFile::size() const {
    return fileSize;
}

const std::string& MappedFile::path() const {
    return filePath;
}

boost::interprocess::mapped_region MappedFile::map(uint64_t offset, size_t length) const {
    return boost::interprocess::mapped_region(fileMapping, boost::interprocess::read_only,
                                              static_cast<boost::interprocess::offset_t>(offset),
                                              length);
}

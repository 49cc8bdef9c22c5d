#pragma once
#include <cstdint>
#include <string>
#include <boost/interprocess/file_mapping.hpp>
#include <boost/interprocess/mapped_region.hpp>

// Read-only mapping of a whole file. Each read maps only the window it needs,
// so the full file is never resident.
class MappedFile {
public:
    // Throws boost::interprocess::interprocess_exception when the file cannot be opened.
    explicit MappedFile(const std::string& path);

    uint64_t size() const;
    const std::string& path() const;

    // Maps [offset, offset + length). Boost aligns the region to the page
    // size internally; get_address() points at 'offset'.
    boost::interprocess::mapped_region map(uint64_t offset, size_t length) const;

private:
    std::string filePath;
    uint64_t fileSize;
    boost::interprocess::file_mapping fileMapping;
};

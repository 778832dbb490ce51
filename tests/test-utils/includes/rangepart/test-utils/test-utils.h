#pragma once

#include <boost/filesystem.hpp>
#include <boost/json/value.hpp>
#include <gtest/gtest.h>
#include <string>
#include <vector>

// Paths of fixture files under tests/
class TestDataPath
{
public:
    static std::string
    get_path(const std::string& relative_path);
};

// JSON loading helper
boost::json::value
load_json_from_file(const std::string& file_path);

// Scratch directory removed (with its contents) on destruction
class TempDir
{
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir&
    operator=(const TempDir&) = delete;

    const boost::filesystem::path&
    path() const
    {
        return path_;
    }

    // Write `content` to path() / relative_path, creating parent directories
    boost::filesystem::path
    write_file(const std::string& relative_path, const std::string& content)
        const;

private:
    boost::filesystem::path path_;
};

// Read a whole file as text
std::string
read_file(const boost::filesystem::path& path);

// Split text into lines, dropping the final empty line after a trailing '\n'
std::vector<std::string>
split_lines(const std::string& text);

// Lines of text separated by '\n', each followed by a terminator
std::string
make_records(const std::vector<std::string>& records, char terminator = '\n');

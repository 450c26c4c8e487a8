/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "FileIO.hpp"
#include "Debug.hpp"
#include <errno.h>
#include <stdio.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/types.h>

namespace sendcore {

std::recursive_mutex gFileMutex;

bool
fileExists(const std::string &path)
{
    AutoFileLock lock(gFileMutex);

    return 0 == access(path.c_str(), F_OK);
}

std::string
fileDirectory(const std::string &path)
{
    auto slash = path.rfind('/');
    if (std::string::npos == slash)
        return std::string();
    return path.substr(0, slash + 1);
}

Status
fileEnsureDir(const std::string &dir)
{
    AutoFileLock lock(gFileMutex);

    if (dir.empty() || fileExists(dir))
        return Status();

    // Create the parents first:
    auto parent = fileDirectory(dir.back() == '/' ?
                                dir.substr(0, dir.size() - 1) : dir);
    if (!parent.empty() && parent != dir)
        SC_CHECK(fileEnsureDir(parent));

    if (mkdir(dir.c_str(), S_IRWXU) && EEXIST != errno)
        return SC_ERROR(SC_CC_SysError, "Could not create directory " + dir);

    return Status();
}

Status
fileLoad(DataChunk &result, const std::string &path)
{
    AutoFileLock lock(gFileMutex);

    FILE *fp = fopen(path.c_str(), "rb");
    if (!fp)
    {
        if (!fileExists(path))
            return SC_ERROR(SC_CC_FileDoesNotExist, "No such file: " + path);
        return SC_ERROR(SC_CC_FileReadError, "Cannot open for reading: " + path);
    }

    fseek(fp, 0, SEEK_END);
    long size = ftell(fp);
    fseek(fp, 0, SEEK_SET);
    if (size < 0)
    {
        fclose(fp);
        return SC_ERROR(SC_CC_FileReadError, "Cannot size file: " + path);
    }

    result.resize(size);
    if (size && fread(result.data(), 1, size, fp) != static_cast<size_t>(size))
    {
        fclose(fp);
        return SC_ERROR(SC_CC_FileReadError, "Cannot read file: " + path);
    }

    fclose(fp);
    return Status();
}

Status
fileSave(DataSlice data, const std::string &path)
{
    AutoFileLock lock(gFileMutex);
    SC_DebugLog("Writing file %s", path.c_str());

    SC_CHECK(fileEnsureDir(fileDirectory(path)));

    // Write to the side, then swap it in:
    const auto temp = path + ".tmp";
    FILE *fp = fopen(temp.c_str(), "wb");
    if (!fp)
        return SC_ERROR(SC_CC_FileWriteError, "Cannot open for writing: " + temp);

    if (data.size() && 1 != fwrite(data.data(), data.size(), 1, fp))
    {
        fclose(fp);
        return SC_ERROR(SC_CC_FileWriteError, "Cannot write file: " + temp);
    }
    if (fclose(fp))
        return SC_ERROR(SC_CC_FileWriteError, "Cannot close file: " + temp);

    if (rename(temp.c_str(), path.c_str()))
        return SC_ERROR(SC_CC_FileWriteError, "Cannot replace file: " + path);

    return Status();
}

Status
fileDelete(const std::string &path)
{
    AutoFileLock lock(gFileMutex);

    if (!fileExists(path))
        return Status();
    if (unlink(path.c_str()))
        return SC_ERROR(SC_CC_SysError, "Cannot delete " + path);

    return Status();
}

} // namespace sendcore

/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Filesystem access functions
 */

#ifndef SENDCORE_UTIL_FILE_IO_HPP
#define SENDCORE_UTIL_FILE_IO_HPP

#include "Data.hpp"
#include "Status.hpp"
#include <mutex>

namespace sendcore {

extern std::recursive_mutex gFileMutex;
typedef std::lock_guard<std::recursive_mutex> AutoFileLock;

/**
 * Returns true if the path exists.
 */
bool
fileExists(const std::string &path);

/**
 * Returns the directory part of a path, or "" for a bare filename.
 */
std::string
fileDirectory(const std::string &path);

/**
 * Ensures that a directory exists, creating it if not.
 */
Status
fileEnsureDir(const std::string &dir);

/**
 * Reads a file from disk.
 */
Status
fileLoad(DataChunk &result, const std::string &path);

/**
 * Writes a file to disk, replacing it atomically.
 */
Status
fileSave(DataSlice data, const std::string &path);

/**
 * Deletes a single file. A missing file is not an error.
 */
Status
fileDelete(const std::string &path);

} // namespace sendcore

#endif

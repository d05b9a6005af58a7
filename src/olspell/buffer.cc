// Copyright 2010 University of Helsinki
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#include "buffer.h"
#include "hfst-ol.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace olspell {

MemoryBuffer::MemoryBuffer(const std::string& bytes):
    bytes_(bytes)
{}

MemoryBuffer::MemoryBuffer(std::string&& bytes):
    bytes_(std::move(bytes))
{}

MemoryBuffer::MemoryBuffer(const char* bytes, size_t length):
    bytes_(bytes, length)
{}

const char*
MemoryBuffer::data() const
{
    return bytes_.data();
}

size_t
MemoryBuffer::size() const
{
    return bytes_.size();
}

MappedFile::MappedFile(const std::string& filename):
    map_(NULL),
    length_(0)
{
    int fd = open(filename.c_str(), O_RDONLY);
    if (fd < 0) {
        OLSPELL_THROW_MESSAGE(FileOpeningException,
                              filename + ": " + strerror(errno));
    }
    struct stat st;
    if (fstat(fd, &st) != 0) {
        int err = errno;
        close(fd);
        OLSPELL_THROW_MESSAGE(FileOpeningException,
                              filename + ": " + strerror(err));
    }
    length_ = static_cast<size_t>(st.st_size);
    if (length_ == 0) {
        // mmap refuses empty mappings; an empty view is still a valid buffer
        close(fd);
        return;
    }
    map_ = mmap(NULL, length_, PROT_READ, MAP_PRIVATE, fd, 0);
    int err = errno;
    close(fd);
    if (map_ == MAP_FAILED) {
        map_ = NULL;
        OLSPELL_THROW_MESSAGE(FileOpeningException,
                              filename + ": mmap failed: " + strerror(err));
    }
}

MappedFile::~MappedFile()
{
    if (map_ != NULL) {
        munmap(map_, length_);
    }
}

const char*
MappedFile::data() const
{
    return static_cast<const char*>(map_);
}

size_t
MappedFile::size() const
{
    return length_;
}

ByteBufferPtr
map_file(const std::string& filename)
{
    return ByteBufferPtr(new MappedFile(filename));
}

} // namespace olspell

/* -*- Mode: C++ -*- */
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

#ifndef OLSPELL_BUFFER_H_
#define OLSPELL_BUFFER_H_ 1

#include "olspell-stdafx.h"

#include <cstddef>
#include <memory>
#include <string>

namespace olspell
{

    //! @brief Immutable bytes that a transducer is decoded from.
    //!
    //! Transducers keep a shared reference to their buffer and read their
    //! tables directly out of it, so a buffer must stay unchanged for its
    //! whole lifetime.
    class OLSPELL_API ByteBuffer
    {
    public:
        virtual ~ByteBuffer() {}
        virtual const char* data() const = 0;
        virtual size_t size() const = 0;
    };

    //! @brief Buffer owning a copy of bytes handed over by a container layer.
    class OLSPELL_API MemoryBuffer : public ByteBuffer
    {
    public:
        explicit MemoryBuffer(const std::string& bytes);
        explicit MemoryBuffer(std::string&& bytes);
        MemoryBuffer(const char* bytes, size_t length);
        const char* data() const;
        size_t size() const;
    private:
        std::string bytes_;
    };

    //! @brief Read-only memory map of a whole file.
    class OLSPELL_API MappedFile : public ByteBuffer
    {
    public:
        //! @brief map @a filename, throws FileOpeningException on failure
        explicit MappedFile(const std::string& filename);
        ~MappedFile();
        const char* data() const;
        size_t size() const;
    private:
        MappedFile(const MappedFile&);
        MappedFile& operator=(const MappedFile&);

        void* map_;
        size_t length_;
    };

    typedef std::shared_ptr<const ByteBuffer> ByteBufferPtr;

    //! @brief convenience for mapping a transducer file
    OLSPELL_API ByteBufferPtr map_file(const std::string& filename);

} // namespace olspell

#endif // OLSPELL_BUFFER_H_

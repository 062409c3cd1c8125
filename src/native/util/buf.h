/* Copyright (C) 2016 NooBaa */
#pragma once

#include "common.h"

namespace chunkbench
{

/**
 * Byte buffer with a shared allocation.
 * Copies and slices share the memory of the original allocation.
 * Use Buf::copy to take an owned copy of foreign memory.
 */
class Buf
{
public:
    Buf()
        : _data(0), _len(0) {}

    explicit Buf(int len)
        : _alloc(new Alloc(len)), _data(_alloc->data()), _len(_alloc->length()) {}

    explicit Buf(int len, uint8_t fill)
        : _alloc(new Alloc(len)), _data(_alloc->data()), _len(_alloc->length())
    {
        memset(_data, fill, _len);
    }

    Buf(const Buf& other) { init(other); }

    Buf(const Buf& other, int offset, int len)
    {
        init(other);
        slice(offset, len);
    }

    ~Buf() {}

    const Buf&
    operator=(const Buf& other)
    {
        init(other);
        return other;
    }

    // copyful - the returned buffer owns its memory
    static Buf
    copy(const void* data, int len)
    {
        Buf buf(len);
        if (len > 0) {
            memcpy(buf._data, data, len);
        }
        return buf;
    }

    inline uint8_t*
    data()
    {
        return _data;
    }

    inline const uint8_t*
    data() const
    {
        return _data;
    }

    inline int
    length() const
    {
        return _len;
    }

    inline uint8_t& operator[](int i) { return _data[i]; }

    inline const uint8_t& operator[](int i) const { return _data[i]; }

    inline void
    slice(int offset, int len)
    {
        // skip to offset
        if (offset > _len) {
            offset = _len;
        }
        if (offset < 0) {
            offset = 0;
        }
        _data += offset;
        _len -= offset;
        // truncate to length
        if (_len > len) {
            _len = len;
        }
        if (_len < 0) {
            _len = 0;
        }
    }

    inline bool
    same(const Buf& buf) const
    {
        return (_len == buf._len) && !memcmp(_data, buf._data, _len);
    }

    inline bool
    same(const void* data, int len) const
    {
        return (_len == len) && !memcmp(_data, data, _len);
    }

    inline std::string
    hex() const
    {
        std::string str;
        str.resize(2 * _len);
        for (int i = 0, j = 0; i < _len; ++i, j += 2) {
            str[j] = HEX_CHARS[_data[i] >> 4];
            str[j + 1] = HEX_CHARS[_data[i] & 0xf];
        }
        return str;
    }

    /**
     * dump memory in hex
     */
    static void hexdump(const void* p, size_t len, const char* prefix = NULL);

private:
    class Alloc
    {
    private:
        uint8_t* _data;
        int _len;

    public:
        explicit Alloc(int len)
            : _data(new uint8_t[len]), _len(len) {}

        Alloc(const Alloc&) = delete;
        Alloc& operator=(const Alloc&) = delete;

        ~Alloc() { delete[] _data; }

        inline uint8_t*
        data()
        {
            return _data;
        }

        inline int
        length()
        {
            return _len;
        }
    };

    void
    init(const Buf& other)
    {
        _alloc = other._alloc;
        _data = other._data;
        _len = other._len;
    }

    static const char HEX_CHARS[16];

    std::shared_ptr<Alloc> _alloc;
    uint8_t* _data;
    int _len;
};

} // namespace chunkbench

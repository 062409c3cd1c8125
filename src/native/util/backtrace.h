/* Copyright (C) 2016 NooBaa */
#pragma once

#include <iostream>
#include <sstream>
#include <stdint.h>
#include <stdlib.h>
#include <string>
#include <vector>

#include <cxxabi.h>
#include <dlfcn.h>
#include <execinfo.h>

namespace chunkbench
{

/**
 * Captures the call stack of the current thread when constructed.
 */
class Backtrace
{
public:
    struct Entry
    {
        explicit Entry(
            void* addr_,
            std::string file_,
            std::string func_)
            : addr(addr_)
            , file(file_)
            , func(func_)
        {
        }
        void* addr;
        std::string file;
        std::string func;
    };

    enum
    {
        MAX_DEPTH = 96
    };

    // skip counts frames above the caller, the constructor itself is always skipped
    explicit Backtrace(int depth = 32, int skip = 0)
    {
        void* trace[MAX_DEPTH];
        if (depth > MAX_DEPTH) {
            depth = MAX_DEPTH;
        }
        int stack_depth = backtrace(trace, depth);
        for (int i = skip + 1; i < stack_depth; i++) {
            Dl_info info;
            if (!dladdr(trace[i], &info)) {
                break;
            }
            std::string func;
            if (info.dli_sname) {
                int status = -1;
                char* demangled = abi::__cxa_demangle(info.dli_sname, NULL, 0, &status);
                if (status == 0 && demangled) {
                    func = demangled;
                } else {
                    func = info.dli_sname;
                }
                if (demangled) {
                    free(demangled);
                }
            } else {
                std::stringstream s;
                s << "0x" << std::hex << uintptr_t(info.dli_saddr);
                func = s.str();
            }
            std::string file;
            if (info.dli_fname) {
                file = info.dli_fname;
            }
            if (file.empty()) {
                break; // entries after main
            }
            _stack.push_back(Entry(trace[i], file, func));
        }
    }

    friend std::ostream& operator<<(std::ostream& os, const Backtrace& bt)
    {
        os << "Backtrace:" << std::endl;
        for (const Entry& e : bt._stack) {
            os << "\t" << e.addr << " " << e.file << " " << e.func << std::endl;
        }
        return os;
    }

private:
    std::vector<Entry> _stack;
};

} // namespace chunkbench

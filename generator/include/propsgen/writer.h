/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <algorithm>
#include <cassert>
#include <iterator>
#include <ostream>
#include <string>

#include <fmt/format.h>
#include <fmt/ostream.h>

namespace propsgen
{
    // line writer for generated code, "{{" and "}}" in a format string open and close an indent level
    // named placeholders are passed with fmt::arg("name", value)
    class writer
    {
        std::ostream& strm_;
        int count_ = 0;

    public:
        writer(std::ostream& strm)
            : strm_(strm)
        {
        }

        writer(std::ostream& strm, int tab_count)
            : strm_(strm)
            , count_(tab_count)
        {
        }

        template<typename S, typename... Args> void operator()(const S& format_str, Args&&... args)
        {
            std::string str(format_str);
            if (str.empty())
            {
                strm_ << "\n";
                return;
            }
            int tmp = 0;
            std::for_each(std::begin(str),
                std::end(str),
                [&](char val)
                {
                    if (val == '{')
                    {
                        tmp++;
                    }
                    else if (val == '}')
                    {
                        tmp--;
                    }
                });
            assert(!(tmp % 2)); // should always be in pairs
            if (str[0] != '#' && tmp >= 0)
                print_tabs();
            count_ += tmp / 2;
            if (str[0] != '#' && tmp < 0)
                print_tabs();
            std::string buffer;
            fmt::vformat_to(std::back_inserter(buffer), str, fmt::make_format_args(args...));
            strm_ << buffer << "\n";
        }
        void write_buffer(const std::string& str) { strm_ << str; }
        void print_tabs()
        {
            for (int i = 0; i < count_; i++)
            {
                strm_ << '\t';
            }
        }
    };
}

#pragma once
#include <fstream>
#include <iostream>
#include <string>

namespace mscan::log
{
    // One logger per process run, created by main and passed down by reference.
    class Logger
    {
    public:
        explicit Logger(bool debug = false) : debug_(debug) {}

        void set_debug(bool debug) { debug_ = debug; }
        bool debug() const { return debug_; }

        // Mirror every line into a file as well (appends). Returns false if it cannot be opened.
        bool open_file(const std::string &path)
        {
            file_.open(path, std::ios::app);
            return file_.is_open();
        }

        void d(const std::string &msg)
        {
            if (debug_)
                write("[DBG] ", msg);
        }
        void i(const std::string &msg) { write("[INF] ", msg); }
        void w(const std::string &msg) { write("[WRN] ", msg); }
        void e(const std::string &msg) { write("[ERR] ", msg); }

    private:
        void write(const char *tag, const std::string &msg)
        {
            std::cerr << tag << msg << "\n";
            if (file_.is_open())
                file_ << tag << msg << "\n";
        }

        bool debug_{false};
        std::ofstream file_;
    };
}

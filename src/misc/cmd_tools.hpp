#pragma once

#include <initializer_list>
#include <iosfwd>
#include <map>
#include <string>

namespace wl {
    namespace misc {

        struct CmdOption {
            enum Type { Bool, Int, Double, String };

            CmdOption() : type(String) {}
            CmdOption(const std::string & n, bool v, const std::string & desc);
            CmdOption(const std::string & n, int v, const std::string & desc);
            CmdOption(const std::string & n, double v, const std::string & desc);
            CmdOption(const std::string & n, const char * v, const std::string & desc);
            CmdOption(const std::string & n, const std::string & v,
                      const std::string & desc);

            std::string name;
            Type type;
            std::string value;
            std::string description;
        };

        // options given as -%name%=%value% or -%name% (for boolean options)
        class CmdOptions {
        public:
            CmdOptions() {}
            CmdOptions(std::initializer_list<CmdOption> ilist);

            CmdOption & operator[](const std::string & name) { return _options[name]; }
            const CmdOption & operator[](const std::string & name) const {
                return _options.at(name);
            }
            bool contains(const std::string & name) const {
                return _options.find(name) != _options.end();
            }

            template <class T> T value(const std::string & name) const;

            // returns false if any argument is rejected
            bool parseArguments(int argc, const char * const * argv);
            void printUsage(std::ostream & os) const;

        private:
            std::string _programName;
            std::map<std::string, CmdOption> _options;
        };

        template <> bool CmdOptions::value<bool>(const std::string & name) const;
        template <> int CmdOptions::value<int>(const std::string & name) const;
        template <> double CmdOptions::value<double>(const std::string & name) const;
        template <>
        std::string CmdOptions::value<std::string>(const std::string & name) const;
    }
}

#include <iostream>
#include <stdexcept>

#include "../core/errors.hpp"
#include "cmd_tools.hpp"

namespace wl {
    namespace misc {

        CmdOption::CmdOption(const std::string & n, bool v, const std::string & desc)
            : name(n), type(Bool), value(v ? "on" : "off"), description(desc) {}
        CmdOption::CmdOption(const std::string & n, int v, const std::string & desc)
            : name(n), type(Int), value(std::to_string(v)), description(desc) {}
        CmdOption::CmdOption(const std::string & n, double v, const std::string & desc)
            : name(n), type(Double), value(std::to_string(v)), description(desc) {}
        CmdOption::CmdOption(const std::string & n, const char * v,
                             const std::string & desc)
            : name(n), type(String), value(v), description(desc) {}
        CmdOption::CmdOption(const std::string & n, const std::string & v,
                             const std::string & desc)
            : name(n), type(String), value(v), description(desc) {}

        CmdOptions::CmdOptions(std::initializer_list<CmdOption> ilist) {
            for (auto && opt : ilist) {
                _options[opt.name] = opt;
            }
        }

        namespace {
            bool ValidValue(CmdOption::Type type, const std::string & value) {
                try {
                    size_t consumed = 0;
                    switch (type) {
                        case CmdOption::Bool:
                            return value == "on" || value == "off";
                        case CmdOption::Int:
                            std::stoi(value, &consumed);
                            return consumed == value.size();
                        case CmdOption::Double:
                            std::stod(value, &consumed);
                            return consumed == value.size();
                        case CmdOption::String:
                            return true;
                    }
                } catch (const std::logic_error &) {
                }
                return false;
            }

            const CmdOption & CheckedOption(const std::map<std::string, CmdOption> & options,
                                            const std::string & name, CmdOption::Type type) {
                auto it = options.find(name);
                if (it == options.end()) {
                    throw core::InvalidInput(name, "no such option");
                }
                if (it->second.type != type) {
                    throw core::InvalidInput(name, "option is accessed with a wrong type");
                }
                return it->second;
            }
        }

        template <> bool CmdOptions::value<bool>(const std::string & name) const {
            return CheckedOption(_options, name, CmdOption::Bool).value == "on";
        }
        template <> int CmdOptions::value<int>(const std::string & name) const {
            return std::stoi(CheckedOption(_options, name, CmdOption::Int).value);
        }
        template <> double CmdOptions::value<double>(const std::string & name) const {
            return std::stod(CheckedOption(_options, name, CmdOption::Double).value);
        }
        template <>
        std::string CmdOptions::value<std::string>(const std::string & name) const {
            return CheckedOption(_options, name, CmdOption::String).value;
        }

        bool CmdOptions::parseArguments(int argc, const char * const * argv) {
            if (argc <= 0) {
                std::cout << "no arguments received!" << std::endl;
                return false;
            }
            _programName = argv[0];
            bool ok = true;
            for (int i = 1; i < argc; i++) {
                std::string arg = argv[i];
                if (arg.empty())
                    continue;
                if (arg[0] != '-' || arg.size() <= 1) {
                    std::cout << "\"" << arg
                              << "\" does not satisfy '-%name%=%value%' or -%name% (for "
                                 "boolean option)"
                              << std::endl;
                    ok = false;
                    continue;
                }
                auto eq_pos = arg.find_first_of('=');
                std::string key = arg.substr(
                    1, eq_pos == std::string::npos ? std::string::npos : eq_pos - 1);
                if (!contains(key)) {
                    std::cout << "\"" << arg << "\" invalid option name : " << key
                              << std::endl;
                    ok = false;
                    continue;
                }
                CmdOption & opt = _options[key];
                if (eq_pos == std::string::npos) {
                    if (opt.type == CmdOption::Bool) {
                        opt.value = "on";
                    } else {
                        std::cout << "\"" << arg << "\" invalid option value" << std::endl;
                        ok = false;
                    }
                    continue;
                }
                std::string value = arg.substr(eq_pos + 1);
                if (!ValidValue(opt.type, value)) {
                    std::cout << "\"" << arg << "\" invalid option value" << std::endl;
                    ok = false;
                    continue;
                }
                opt.value = value;
            }
            return ok;
        }

        void CmdOptions::printUsage(std::ostream & os) const {
            os << "usage: " << (_programName.empty() ? "program" : _programName)
               << " [-name=value ...]" << std::endl;
            for (auto & opt : _options) {
                os << "  -" << opt.first << " (default: " << opt.second.value << ")  "
                   << opt.second.description << std::endl;
            }
        }
    }
}

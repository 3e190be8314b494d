//
// Class ParameterList
//   Typed key/value store for run parameters (grid size, step sizes,
//   lattice coarseness, ...). Values added in code fix the type of a key;
//   assign() overrides a value from text such as a command line argument
//   "xi_step_size=0.01", converting it to that type.
//   Example:
//      qsw::ParameterList params;
//      params.add<double>("grid_step_size", 0.025);
//      params.assign("grid_step_size=0.05");
//      params.get<double>("grid_step_size");
//
#ifndef QSW_PARAMETER_LIST_H
#define QSW_PARAMETER_LIST_H

#include <iomanip>
#include <iostream>
#include <iterator>
#include <map>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

#include "Utility/QswException.h"

namespace qsw {

    /*!
     * @file ParameterList.h
     * @class ParameterList
     */
    class ParameterList {
    public:
        // allowed parameter types
        using variant_t = std::variant<double, bool, std::string, int>;

        ParameterList()                                = default;
        ParameterList(const ParameterList&)            = default;
        ParameterList& operator=(const ParameterList&) = default;

        /*!
         * Add a single parameter to this list.
         * @param key is the name of the parameter
         * @param value is the parameter value
         */
        template <typename T>
        void add(const std::string& key, const T& value) {
            if (params_m.contains(key)) {
                throw QswException("ParameterList::add()",
                                   "Parameter '" + key + "' already exists.");
            }
            params_m[key] = value;
        }

        /*!
         * Obtain the value of a parameter. This function
         * throws an error if the key is not contained or
         * holds a value of another type.
         * @param key the name of the parameter
         * @returns the value of a parameter
         */
        template <typename T>
        T get(const std::string& key) const {
            if (!params_m.contains(key)) {
                throw QswException("ParameterList::get()",
                                   "Parameter '" + key + "' not contained.");
            }
            const T* value = std::get_if<T>(&params_m.at(key));
            if (value == nullptr) {
                throw QswException("ParameterList::get()",
                                   "Parameter '" + key + "' has a different type.");
            }
            return *value;
        }

        /*!
         * Obtain the value of a parameter. If the key is
         * not contained, the default value is returned.
         * @param key the name of the parameter
         * @param defval the default value of the parameter
         * @returns the value of a parameter
         */
        template <typename T>
        T get(const std::string& key, const T& defval) const {
            if (!params_m.contains(key)) {
                return defval;
            }
            return get<T>(key);
        }

        bool contains(const std::string& key) const { return params_m.contains(key); }

        /*!
         * Merge a parameter list into this parameter list.
         * @param p the parameter list to merge into this
         */
        void merge(const ParameterList& p) noexcept {
            for (const auto& [key, value] : p.params_m) {
                params_m[key] = value;
            }
        }

        /*!
         * Update the parameter values of this list with the
         * values provided in the input parameter list.
         * @param p the input parameter list with update parameter values
         */
        void update(const ParameterList& p) noexcept {
            for (const auto& [key, value] : p.params_m) {
                if (params_m.contains(key)) {
                    params_m[key] = value;
                }
            }
        }

        /*!
         * Update the single parameter value of this list.
         * @param key is the name of the parameter
         * @param value is the parameter value
         */
        template <typename T>
        void update(const std::string& key, const T& value) {
            if (!params_m.contains(key)) {
                throw QswException("ParameterList::update()",
                                   "Parameter '" + key + "' does not exist.");
            }
            params_m[key] = value;
        }

        /*!
         * Overrides an existing parameter from a "key=value" string. The
         * text is converted to the type the parameter already holds.
         * @param assignment the key and the new value separated by '='
         */
        void assign(const std::string& assignment) {
            const auto eq = assignment.find('=');
            if (eq == std::string::npos || eq == 0) {
                throw QswException("ParameterList::assign()",
                                   "Expected key=value, got '" + assignment + "'.");
            }
            const std::string key  = assignment.substr(0, eq);
            const std::string text = assignment.substr(eq + 1);
            if (!params_m.contains(key)) {
                throw QswException("ParameterList::assign()",
                                   "Unknown parameter '" + key + "'.");
            }
            std::visit([&](auto& value) { value = fromString(key, text, value); },
                       params_m.at(key));
        }

        /*!
         * Print this parameter list, one key per line.
         */
        friend std::ostream& operator<<(std::ostream& os, const ParameterList& sp) {
            for (auto it = sp.params_m.begin(); it != sp.params_m.end(); ++it) {
                os << std::left << std::setw(32) << it->first << " ";
                std::visit([&](const auto& arg) { os << std::boolalpha << arg; }, it->second);
                if (std::next(it) != sp.params_m.end()) {
                    os << '\n';
                }
            }
            return os;
        }

    private:
        static bool fromString(const std::string& key, const std::string& text, bool) {
            if (text == "true" || text == "on" || text == "1") {
                return true;
            }
            if (text == "false" || text == "off" || text == "0") {
                return false;
            }
            throw QswException("ParameterList::assign()",
                               "Parameter '" + key + "' expects a boolean, got '" + text + "'.");
        }

        static std::string fromString(const std::string&, const std::string& text,
                                      const std::string&) {
            return text;
        }

        template <typename T>
        static T fromString(const std::string& key, const std::string& text, T) {
            std::size_t parsed = 0;
            T value{};
            try {
                if constexpr (std::is_integral_v<T>) {
                    value = std::stoi(text, &parsed);
                } else {
                    value = std::stod(text, &parsed);
                }
            } catch (const std::logic_error&) {
                parsed = 0;
            }
            if (parsed == 0 || parsed != text.length()) {
                throw QswException("ParameterList::assign()", "Parameter '" + key
                                                                  + "' expects a number, got '"
                                                                  + text + "'.");
            }
            return value;
        }

    protected:
        std::map<std::string, variant_t> params_m;
    };
}  // namespace qsw

#endif

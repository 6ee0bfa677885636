#include <cctype>        // for isdigit
#include <functional>    // for function
#include <stdexcept>     // for invalid_argument
#include <type_traits>   // for is_arithmetic_v, is_integral_v
#include <vector>        // for vector

namespace nvec {
    namespace util {
        namespace detail {
            struct format_spec_t {
                int width       = 0;
                int precision   = -1;
                bool scientific = false;
            };

            // widths and precisions past this are rejected
            inline constexpr int max_spec_value = 1024;

            inline int read_number(std::string_view spec, std::size_t& pos)
            {
                int value = 0;
                while (pos < spec.size() &&
                       std::isdigit(static_cast<unsigned char>(spec[pos]))) {
                    value = value * 10 + (spec[pos] - '0');
                    if (value > max_spec_value) {
                        throw std::invalid_argument(
                            "format width or precision too large"
                        );
                    }
                    pos++;
                }
                return value;
            }

            inline format_spec_t parse_spec(std::string_view spec)
            {
                format_spec_t result;
                std::size_t pos = 0;
                while (pos < spec.size()) {
                    const auto ch = spec[pos];
                    if (ch == '>') {
                        pos++;
                        result.width = read_number(spec, pos);
                    }
                    else if (ch == '.') {
                        pos++;
                        result.precision = read_number(spec, pos);
                    }
                    else if (ch == 'e') {
                        result.scientific = true;
                        pos++;
                    }
                    else if (ch == 'f') {
                        pos++;
                    }
                    else {
                        throw std::invalid_argument(
                            "syntax error in format string, unknown format "
                            "signifier"
                        );
                    }
                }
                return result;
            }

            using arg_writer_t =
                std::function<void(std::ostream&, const format_spec_t&)>;

            // numbers are streamed with the requested precision, anything
            // else is streamed as is and only padded
            template <typename T>
            arg_writer_t make_writer(const T& arg)
            {
                return [&arg](std::ostream& os, const format_spec_t& spec) {
                    std::ostringstream ss;
                    if constexpr (std::is_arithmetic_v<T>) {
                        if (spec.precision >= 0) {
                            ss << (spec.scientific ? std::scientific
                                                   : std::fixed)
                               << std::setprecision(spec.precision);
                            if constexpr (std::is_integral_v<T>) {
                                ss << static_cast<long double>(arg);
                            }
                            else {
                                ss << arg;
                            }
                        }
                        else {
                            ss << arg;
                        }
                    }
                    else {
                        ss << arg;
                    }
                    os << std::setw(spec.width) << ss.str();
                };
            }
        }   // namespace detail

        template <typename... ARGS>
        std::string format(std::string_view fmt, const ARGS&... args)
        {
            const std::vector<detail::arg_writer_t> writers = {
              detail::make_writer(args)...
            };

            std::ostringstream out;
            std::size_t index = 0;
            std::size_t cidx  = 0;
            while (cidx < fmt.size()) {
                const auto ch = fmt[cidx];
                if (ch != '{') {
                    out << ch;
                    cidx++;
                    continue;
                }

                const auto close = fmt.find('}', cidx);
                if (close == std::string_view::npos) {
                    throw std::invalid_argument(
                        "syntax error in format string, "
                        "missing closing brace"
                    );
                }

                const auto body = fmt.substr(cidx + 1, close - cidx - 1);
                detail::format_spec_t spec;
                if (!body.empty()) {
                    if (body.front() != ':') {
                        throw std::invalid_argument(
                            "syntax error in format string, "
                            "missing format signifier (:)"
                        );
                    }
                    spec = detail::parse_spec(body.substr(1));
                }

                if (index >= writers.size()) {
                    throw std::invalid_argument(
                        "format string has more placeholders than arguments"
                    );
                }
                writers[index++](out, spec);
                cidx = close + 1;
            }
            return out.str();
        }

        template <Color C, typename... ARGS>
        void write_to(std::ostream& os, std::string_view fmt, ARGS... args)
        {
            const auto text = format(fmt, args...);
            if constexpr (C == Color::DEFAULT) {
                os << text;
            }
            else {
                os << color_map.at(C) << text << color_map.at(Color::RESET);
            }
        }

        template <Color C, typename... ARGS>
        void write(std::string_view fmt, ARGS... args)
        {
            write_to<C>(std::cout, fmt, args...);
        }

        template <Color C, typename... ARGS>
        void writeln(std::string_view fmt, ARGS... args)
        {
            std::cout << "\n";
            write<C>(fmt, args...);
            std::cout << '\n';
        }
    }   // namespace util

}   // namespace nvec

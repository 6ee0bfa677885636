#include "core/math/vector_algebra.hpp"
#include "core/types/containers/named_vector.hpp"
#include "io/console/logger.hpp"
#include "io/console/printb.hpp"
#include "io/exceptions.hpp"
#include <numbers>
#include <sstream>
#include <string>

using nvec::NamedVector;
using nvec::util::writeln;

namespace {
    std::string show(const NamedVector& v)
    {
        std::ostringstream ss;
        ss << v;
        return ss.str();
    }
}   // namespace

int main()
{
    nvec::io::logger::info("nvec {} demo", nvec::build::constants::version);

    NamedVector a{3, 4};
    NamedVector b{1, 0};

    writeln<nvec::Color::BOLD>("{}", std::string(60, '='));
    writeln("a             = {}", show(a));
    writeln("b             = {}", show(b));
    writeln("a + b         = {}", show(a + b));
    writeln("a - b         = {}", show(a - b));
    writeln("2 a           = {}", show(2 * a));
    writeln("a . b         = {:.4}", a.dot(b));
    writeln("|a|           = {:.4}", a.magnitude());
    writeln("unit(a)       = {}", show(a.unit()));
    writeln("midpoint(a,b) = {}", show(a.midpoint(b)));
    writeln(
        "angle(a,b)    = {:.6} rad ({:.2} deg)",
        a.angle(b),
        a.angle(b) * 180 / std::numbers::pi
    );

    // named and indexed access share storage
    a.x() = 6;
    a.set_item(1, 8);
    writeln("after a.x = 6, a[1] = 8: a = {}, |a| = {:.4}", show(a), a.magnitude());

    // numeric degeneracy propagates as nan rather than an error
    writeln("unit(0, 0)    = {}", show(NamedVector{0, 0}.unit()));

    writeln<nvec::Color::BOLD>("{}", std::string(60, '='));
    try {
        const NamedVector c{1, 2, 3};
        writeln("a + c         = {}", show(a + c));
    }
    catch (const nvec::exception::DimensionMismatchException& e) {
        nvec::io::logger::error("{}", e.what());
    }
    return 0;
}

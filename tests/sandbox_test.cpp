#include "../src/sandbox/SandboxEvaluator.hpp"

#include <cassert>
#include <chrono>
#include <string>

using namespace std::chrono_literals;

static double eval(const std::string& src) {
    auto result = CSandboxEvaluator::evaluate(src, 5000ms);
    assert(result.has_value());
    return *result;
}

static eErrorKind evalError(const std::string& src, std::chrono::milliseconds deadline = 5000ms) {
    auto result = CSandboxEvaluator::evaluate(src, deadline);
    assert(!result.has_value());
    return result.error().kind;
}

int main() {
    // coercions the obfuscation relies on
    {
        assert(eval("+[]") == 0);
        assert(eval("!+[]+!![]") == 2);
        assert(eval("+((!+[]+!![]+!![]+[])+(+!![]))") == 31);
        assert(eval("+((!+[]+!![]+[])+(!+[]+!![]))") == 22);
        assert(eval("\"17.5\"") == 17.5);
        assert(eval("true") == 1);
    }

    // the challenge arithmetic, as the extractor leaves it for example.com
    {
        const std::string SCRIPT = "var s,t,o,p,b,r,e,a,k,i,n,g,f, RDrfOFz={\"KdgiWIQPHF\":+((!+[]+!![]+!![]+[])+(+!![]))};        "
                                   ";RDrfOFz.KdgiWIQPHF-=+((!+[]+!![]+!![]+[])+(!+[]+!![]+!![]+!![]+!![]+!![]+!![]+!![]));"
                                   "RDrfOFz.KdgiWIQPHF*=+((!+[]+!![]+[])+(!+[]+!![]));+RDrfOFz.KdgiWIQPHF.toFixed(10) + 11";
        assert(eval(SCRIPT) == -143);

        CSandboxEvaluator evaluator(5000ms);
        auto              result = evaluator.evaluate("+(\"12345\" + \".6\")");
        assert(result.has_value());
        assert(*result == 12345.6);
    }

    // number formatting follows the language, ties round up
    {
        assert(eval("+(2.5).toFixed(0)") == 3);
        assert(eval("+(0.5).toFixed(0)") == 1);
        assert(eval("+(4768.37158203125).toFixed(10)") == 4768.3715820313);
        assert(eval("(4768.37158203125).toFixed(10) === \"4768.3715820313\" ? 1 : 0") == 1);
        assert(eval("(\"\" + 0.000001) === \"0.000001\" ? 1 : 0") == 1);
        assert(eval("(\"\" + 1e-7) === \"1e-7\" ? 1 : 0") == 1);
    }

    // results that are not finite numbers, and broken programs
    {
        assert(evalError("var x = 1;") == ERROR_MALFORMED);
        assert(evalError("\"not a number\"") == ERROR_MALFORMED);
        assert(evalError("1/0") == ERROR_MALFORMED);
        assert(evalError("+(") == ERROR_MALFORMED);
        assert(evalError("undeclared + 1") == ERROR_MALFORMED);
        assert(evalError("(3)()") == ERROR_MALFORMED);
        assert(evalError("throw 7") == ERROR_MALFORMED);
        assert(evalError("({valueOf: function() { throw 1; }})") == ERROR_MALFORMED);
    }

    // long flat chains and deep nesting from a hostile page never take the host down
    {
        std::string flat = "1";
        for (int i = 0; i < 400000; ++i) {
            flat += "+1";
        }

        auto result = CSandboxEvaluator::evaluate(flat, 5000ms);
        assert(result.has_value() ? *result == 400001 : result.error().kind == ERROR_MALFORMED);

        const std::string NESTED = std::string(100000, '(') + "1" + std::string(100000, ')');
        assert(evalError(NESTED) == ERROR_MALFORMED);
    }

    // the script heap is bounded
    {
        assert(evalError("var s = \"xx\"; while (true) s = s + s") == ERROR_MALFORMED);
        assert(evalError("var a = []; while (true) a.push(new Array(100000).join(\"x\"))") == ERROR_MALFORMED);
    }

    // a program that never ends is cut off at the deadline
    {
        const auto BEGIN = std::chrono::steady_clock::now();
        assert(evalError("var i = 0; while (true) { i++; }", 200ms) == ERROR_TIMEOUT);
        const auto TOOK = std::chrono::steady_clock::now() - BEGIN;

        assert(TOOK >= 200ms);
        assert(TOOK < 1200ms);
    }

    {
        const auto BEGIN = std::chrono::steady_clock::now();
        assert(evalError("for (;;);", 100ms) == ERROR_TIMEOUT);
        assert(std::chrono::steady_clock::now() - BEGIN < 1100ms);
    }

    // the host carries on evaluating after a kill
    assert(eval("6 * 7") == 42);

    return 0;
}

#include "unit_tests.hh"

#include "assert.hh"
#include "string.hh"
#include "utf8.hh"

namespace Tabgrid
{

UnitTest test_utf8{[]()
{
    StringView str = "maïs mélange bientôt";
    tg_assert(utf8::distance(std::begin(str), std::end(str)) == 20);
    tg_assert(utf8::codepoint(std::begin(str) + 2, std::end(str)) == 0x00EF);

    auto it = str.begin() + 2;
    utf8::to_next(it, str.end());
    tg_assert(*it == 's');
    utf8::to_previous(it, str.begin());
    tg_assert(it == str.begin() + 2);

    char buffer[4];
    char* ptr = buffer;
    utf8::dump(ptr, U'é');
    tg_assert(ptr - buffer == 2 and utf8::codepoint(buffer, ptr) == U'é');
}};

#ifdef TABGRID_DEBUG
UnitTest* UnitTest::list = nullptr;

void UnitTest::run_all_tests()
{
    for (const UnitTest* test = UnitTest::list; test; test = test->next)
        test->func();
}
#endif

}

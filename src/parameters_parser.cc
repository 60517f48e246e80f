#include "parameters_parser.hh"

#include "flags.hh"
#include "unit_tests.hh"

#include <algorithm>

namespace Tabgrid
{

String generate_switches_doc(const SwitchMap& switches)
{
    String res;
    if (switches.empty())
        return res;

    auto switch_len = [](const SwitchMapItem& sw) { return sw.key.column_length() + (sw.value.takes_arg ? 5 : 0); };
    ColumnCount maxlen = 0;
    for (auto& sw : switches)
        maxlen = std::max(maxlen, switch_len(sw));

    for (auto& sw : switches) {
        res += format("-{} {}{}{}\n",
                      sw.key,
                      sw.value.takes_arg ? "<arg>" : "",
                      String{' ', maxlen - switch_len(sw) + 1},
                      sw.value.description);
    }
    return res;
}

ParametersParser::ParametersParser(ParameterList params, const ParameterDesc& desc)
    : m_params(params)
{
    const bool switches_only_at_start = desc.flags & ParameterDesc::Flags::SwitchesOnlyAtStart;
    bool only_pos = desc.flags & ParameterDesc::Flags::SwitchesAsPositional;

    Vector<bool> switch_seen(desc.switches.size(), false);
    for (size_t i = 0; i < params.size(); ++i)
    {
        if (not only_pos and params[i] == "--")
            only_pos = true;
        else if (not only_pos and not params[i].empty() and params[i][0_byte] == '-')
        {
            StringView switch_name = params[i].substr(1_byte);
            auto it = std::find_if(desc.switches.begin(), desc.switches.end(),
                                   [&](const SwitchMapItem& sw) { return sw.key == switch_name; });
            if (it == desc.switches.end())
                throw unknown_option(params[i]);

            auto switch_index = it - desc.switches.begin();
            if (switch_seen[switch_index])
                throw runtime_error{format("switch '-{}' specified more than once", it->key)};
            switch_seen[switch_index] = true;

            if (it->value.takes_arg and ++i == params.size())
               throw missing_option_value(it->key);

            m_switches.push_back({switch_name.str(), it->value.takes_arg ? StringView{params[i]} : StringView{}});
        }
        else // positional
        {
            if (switches_only_at_start)
                only_pos = true;
            m_positional_indices.push_back(i);
        }
    }
    size_t count = m_positional_indices.size();
    if (count > desc.max_positionals or count < desc.min_positionals)
        throw wrong_argument_count();
}

Optional<StringView> ParametersParser::get_switch(StringView name) const
{
    auto it = std::find_if(m_switches.begin(), m_switches.end(),
                           [&](const SwitchValue& sw) { return sw.key == name; });
    return it == m_switches.end() ? Optional<StringView>{}
                                  : Optional<StringView>{it->value};
}

UnitTest test_parameters_parser{[]()
{
    const ParameterDesc desc{
        SwitchMap{ { "words", { true, "word list file" } },
                   { "run-tests", { false, "run the unit tests" } } },
        ParameterDesc::Flags::None, 0, 2
    };

    Vector<String> params{ "-words", "list.txt", "go", "-run-tests", "git" };
    ParametersParser parser{params, desc};
    tg_assert(parser.get_switch("words") and *parser.get_switch("words") == "list.txt");
    tg_assert(parser.get_switch("run-tests") and parser.get_switch("run-tests")->empty());
    tg_assert(not parser.get_switch("help"));
    tg_assert(parser.positional_count() == 2 and parser[0] == "go" and parser[1] == "git");

    Vector<String> dashes{ "--", "-words" };
    ParametersParser positional{dashes, desc};
    tg_assert(positional.positional_count() == 1 and positional[0] == "-words");

    Vector<String> unknown{ "-wat" };
    tg_expect_throw(unknown_option, ParametersParser(unknown, desc));
    Vector<String> missing{ "-words" };
    tg_expect_throw(missing_option_value, ParametersParser(missing, desc));
    Vector<String> twice{ "-run-tests", "-run-tests" };
    tg_expect_throw(runtime_error, ParametersParser(twice, desc));
    Vector<String> too_many{ "a", "b", "c" };
    tg_expect_throw(wrong_argument_count, ParametersParser(too_many, desc));

    tg_assert(generate_switches_doc(desc.switches) ==
              "-words <arg> word list file\n"
              "-run-tests   run the unit tests\n");
}};

}

#include "candidate.hh"

#include "assert.hh"
#include "unicode.hh"
#include "unit_tests.hh"
#include "utils.hh"

#include <algorithm>

namespace Tabgrid
{

PrefixCompleterAdapter::PrefixCompleterAdapter(std::unique_ptr<PrefixCompleter> completer)
    : m_completer{std::move(completer)}
{
    tg_assert(m_completer);
}

CandidateList PrefixCompleterAdapter::fetch(StringView line, CharCount pos) const
{
    auto completions = m_completer->complete(line, pos);
    const CharCount shared_length = clamp(completions.shared_length, 0_char, pos);

    const StringView head = line.substr(0_char, pos);
    const StringView tail = line.substr(pos);
    const StringView typed = line.substr(pos - shared_length, shared_length);

    CandidateList res;
    res.reserve(completions.suffixes.size());
    for (auto& suffix : completions.suffixes)
        res.push_back({head + suffix + tail, typed + suffix});
    return res;
}

PrefixCompletions TabCompleter::complete(StringView, CharCount) const
{
    return { {"\t"}, 0 };
}

WordListCompleter::WordListCompleter(Vector<String> words)
    : m_words{std::move(words)}
{
}

PrefixCompletions WordListCompleter::complete(StringView line, CharCount pos) const
{
    const StringView head = line.substr(0_char, pos);
    auto word_begin = head.end();
    while (word_begin != head.begin())
    {
        auto prev = word_begin;
        utf8::to_previous(prev, head.begin());
        if (is_horizontal_blank(utf8::codepoint(prev, head.end())))
            break;
        word_begin = prev;
    }
    const StringView prefix{word_begin, head.end()};

    PrefixCompletions res{{}, prefix.char_length()};
    for (auto& word : m_words)
    {
        if (not word.starts_with(prefix))
            continue;
        String suffix{word.substr(prefix.length())};
        if (std::find(res.suffixes.begin(), res.suffixes.end(), suffix) == res.suffixes.end())
            res.suffixes.push_back(std::move(suffix));
    }
    return res;
}

UnitTest test_completion_sources{[]()
{
    WordListCompleter words{{"go", "git", "git-shell", "grep", "go"}};

    auto completions = words.complete("g", 1);
    tg_assert(completions.suffixes == Vector<String>{"o", "it", "it-shell", "rep"});
    tg_assert(completions.shared_length == 1);

    completions = words.complete("run gi", 6);
    tg_assert(completions.suffixes == Vector<String>{"t", "t-shell"});
    tg_assert(completions.shared_length == 2);

    completions = words.complete("git", 3);
    tg_assert(completions.suffixes == Vector<String>{"", "-shell"});

    completions = words.complete("x ", 2);
    tg_assert(completions.suffixes.size() == 4 and completions.shared_length == 0);

    tg_assert(words.complete("hg", 2).suffixes.empty());

    WordListCompleter unicode_words{{"éléphant", "élan"}};
    completions = unicode_words.complete("un él", 5);
    tg_assert(completions.suffixes == Vector<String>{"éphant", "an"});
    tg_assert(completions.shared_length == 2);

    completions = TabCompleter{}.complete("anything", 3);
    tg_assert(completions.suffixes == Vector<String>{"\t"} and completions.shared_length == 0);
}};

UnitTest test_prefix_completer_adapter{[]()
{
    PrefixCompleterAdapter adapter{std::make_unique<WordListCompleter>(Vector<String>{"go", "git", "git-shell"})};

    auto candidates = adapter.fetch("run g", 5);
    tg_assert(candidates == CandidateList{{"run go", "go"}, {"run git", "git"}, {"run git-shell", "git-shell"}});

    // the text after the cursor is kept
    candidates = adapter.fetch("gi x", 2);
    tg_assert(candidates == CandidateList{{"git x", "git"}, {"git-shell x", "git-shell"}});

    tg_assert(adapter.fetch("run z", 5).empty());

    PrefixCompleterAdapter tab_adapter{std::make_unique<TabCompleter>()};
    tg_assert(tab_adapter.fetch("ab", 1) == CandidateList{{"a\tb", "\t"}});
}};

}

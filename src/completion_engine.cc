#include "completion_engine.hh"

#include "aggregator.hh"
#include "debug.hh"
#include "format.hh"
#include "line_editor.hh"
#include "unit_tests.hh"

namespace Tabgrid
{

CompletionEngine::CompletionEngine(const Completer& completer, LineBuffer& buffer,
                                   OutputSink& sink, ColumnCount width,
                                   const CompletionOptions& options)
    : m_completer{completer},
      m_buffer{buffer},
      m_renderer{sink, options.selected_face},
      m_keymap{options.keymap},
      m_width{width}
{
}

ConstArrayView<Candidate> CompletionEngine::candidates() const
{
    if (not m_session)
        return {};
    return m_session->candidates;
}

static GridMove to_grid_move(CompletionKey key)
{
    switch (key)
    {
        case CompletionKey::Retreat: return GridMove::Retreat;
        case CompletionKey::RowStart: return GridMove::RowStart;
        case CompletionKey::RowEnd: return GridMove::RowEnd;
        case CompletionKey::Up: return GridMove::Up;
        case CompletionKey::Down: return GridMove::Down;
        default: return GridMove::Advance;
    }
}

bool CompletionEngine::handle_key(CompletionKey key)
{
    if (m_width <= 0)
        return false;

    switch (m_state)
    {
        case CompletionState::Idle:
            if (key != CompletionKey::Trigger)
                return false;
            trigger();
            return true;

        case CompletionState::Listing:
            if (key == CompletionKey::Trigger)
            {
                if (m_buffer.line() == m_session->source_line and
                    m_buffer.cursor_pos() == m_session->source_pos)
                {
                    set_state(CompletionState::Selecting);
                    m_session->choice = -1;
                    select_next();
                }
                else
                    trigger();
                return true;
            }
            if (key == CompletionKey::Cancel)
            {
                exit_completion(nullptr);
                return true;
            }
            return false;

        case CompletionState::Selecting:
            return handle_selecting_key(key);
    }
    return false;
}

bool CompletionEngine::handle_selecting_key(CompletionKey key)
{
    auto& session = *m_session;
    switch (key)
    {
        case CompletionKey::Trigger:
        case CompletionKey::Advance:
            select_next();
            return true;

        case CompletionKey::Retreat:
        case CompletionKey::RowStart:
        case CompletionKey::RowEnd:
        case CompletionKey::Up:
        case CompletionKey::Down:
            session.choice = grid_move(session.choice, session.columns,
                                       (int)session.candidates.size(), to_grid_move(key));
            refresh();
            return true;

        case CompletionKey::Accept:
            tg_assert(session.choice >= 0 and session.choice < (int)session.candidates.size());
            exit_completion(&session.candidates[session.choice]);
            return true;

        case CompletionKey::Cancel:
            exit_completion(nullptr);
            return true;

        case CompletionKey::Back:
            session.choice = -1;
            set_state(CompletionState::Listing);
            refresh();
            return false;

        case CompletionKey::Unrecognized:
            exit_completion(nullptr);
            return false;
    }
    return false;
}

void CompletionEngine::trigger()
{
    const bool drawn = m_session and m_session->drawn;
    auto& session = m_session.emplace();
    session.source_line = String{m_buffer.line()};
    session.source_pos = m_buffer.cursor_pos();
    session.drawn = drawn;
    session.candidates = m_completer.fetch(session.source_line, session.source_pos);

    if (debug_flags() & DebugFlags::Completion)
        write_to_debug_log(format("completion: {} candidates for '{}' at {}",
                                  session.candidates.size(), session.source_line,
                                  session.source_pos));

    if (session.candidates.empty())
        return exit_completion(nullptr);
    if (session.candidates.size() == 1)
        return exit_completion(&session.candidates[0]);
    if (auto aggregated = aggregate(session.source_line, session.source_pos, session.candidates))
        return exit_completion(&*aggregated);

    session.choice = -1;
    set_state(CompletionState::Listing);
    refresh();
}

void CompletionEngine::select_next()
{
    auto& session = *m_session;
    // lists are only shown for two candidates or more
    tg_assert(session.candidates.size() > 1);

    session.choice = grid_move(session.choice, session.columns,
                               (int)session.candidates.size(), GridMove::Advance);
    refresh();
}

void CompletionEngine::set_state(CompletionState state)
{
    if (state == m_state)
        return;
    if (debug_flags() & DebugFlags::Completion)
        write_to_debug_log(format("completion: {} -> {}", enum_name(m_state), enum_name(state)));
    m_state = state;
}

void CompletionEngine::exit_completion(const Candidate* chosen)
{
    if (m_session)
    {
        if (m_session->drawn)
            m_renderer.erase(m_buffer, m_width);
        if (chosen)
        {
            if (debug_flags() & DebugFlags::Completion)
                write_to_debug_log(format("completion: writing '{}'", chosen->new_line));
            splice(*m_session, *chosen);
        }
        m_session.reset();
    }
    set_state(CompletionState::Idle);
}

void CompletionEngine::splice(const Session& session, const Candidate& candidate)
{
    const StringView line = session.source_line;
    const StringView head = line.substr(0_char, session.source_pos);
    const StringView tail = line.substr(session.source_pos);
    const StringView new_line = candidate.new_line;

    if (new_line.length() >= line.length() and
        new_line.starts_with(head) and new_line.ends_with(tail))
    {
        const StringView middle = new_line.substr(head.length(), new_line.length() - line.length());
        if (not middle.empty())
            m_buffer.insert(middle);
        return;
    }

    m_buffer.erase_before(session.source_pos);
    m_buffer.erase_after(tail.char_length());
    m_buffer.insert(new_line);
}

void CompletionEngine::refresh()
{
    if (m_state == CompletionState::Idle or not m_session or m_width <= 0)
        return;

    auto& session = *m_session;
    const int selected = m_state == CompletionState::Selecting ? session.choice : -1;
    const auto grid = m_renderer.draw(m_buffer, m_width, session.candidates, selected);
    session.columns = grid.columns;
    session.drawn = session.drawn or grid.columns > 0;
}

void CompletionEngine::on_width_change(ColumnCount width)
{
    m_width = width;
}

namespace
{

// completes the whole text before the cursor, labels only show the added part
struct WordsCompleter : Completer
{
    WordsCompleter(Vector<String> words) : words{std::move(words)} {}

    CandidateList fetch(StringView line, CharCount pos) const override
    {
        ++fetch_count;
        const StringView head = line.substr(0_char, pos);
        const StringView tail = line.substr(pos);
        CandidateList res;
        for (auto& word : words)
        {
            if (word.starts_with(head))
                res.push_back({word + tail, String{word.substr(head.length())}});
        }
        return res;
    }

    Vector<String> words;
    mutable int fetch_count = 0;
};

// always returns the same candidates
struct FixedCompleter : Completer
{
    FixedCompleter(CandidateList candidates) : candidates{std::move(candidates)} {}

    CandidateList fetch(StringView, CharCount) const override { return candidates; }

    CandidateList candidates;
};

const Vector<String> test_words{"go", "git", "git-shell", "grep"};

constexpr const char* listing_30 = "\r\n\033[Jo        it       it-shell \r\nrep      \033[2A\r\033[3C";
constexpr const char* selecting_30 = "\r\n\033[J\033[30;47mo        \033[0mit       it-shell \r\nrep      \033[2A\r\033[3C";
constexpr const char* erase_30 = "\r\n\033[J\033[1A\r\033[3C";

}

UnitTest test_completion_engine_shortcuts{[]()
{
    WordsCompleter completer{test_words};
    StringOutputSink editor_sink, sink;
    LineEditor editor{editor_sink, "> "};

    {
        // nothing happens without a terminal width
        CompletionEngine engine{completer, editor, sink, 0};
        editor.insert("g");
        tg_assert(not engine.handle_key(CompletionKey::Trigger));
        tg_assert(engine.state() == CompletionState::Idle);
        tg_assert(sink.content().empty() and completer.fetch_count == 0);
        engine.refresh();
        tg_assert(sink.content().empty());
    }

    CompletionEngine engine{completer, editor, sink, 30};

    // only the trigger is used when idle
    tg_assert(not engine.handle_key(CompletionKey::Advance));
    tg_assert(not engine.handle_key(CompletionKey::Cancel));
    tg_assert(not engine.handle_key(CompletionKey::Unrecognized));
    tg_assert(completer.fetch_count == 0);

    // single candidate is written directly
    editor.reset();
    editor.insert("git-");
    tg_assert(engine.handle_key(CompletionKey::Trigger));
    tg_assert(engine.state() == CompletionState::Idle);
    tg_assert(editor.line() == "git-shell" and editor.cursor_pos() == 9);
    tg_assert(sink.content().empty());

    // common extension is written directly
    editor.reset();
    editor.insert("gi");
    tg_assert(engine.handle_key(CompletionKey::Trigger));
    tg_assert(engine.state() == CompletionState::Idle);
    tg_assert(editor.line() == "git");
    tg_assert(sink.content().empty());

    // no candidate, the trigger is still used
    editor.reset();
    editor.insert("x");
    tg_assert(engine.handle_key(CompletionKey::Trigger));
    tg_assert(engine.state() == CompletionState::Idle);
    tg_assert(editor.line() == "x");
    tg_assert(engine.candidates().empty());
    tg_assert(sink.content().empty());
}};

UnitTest test_completion_engine_selecting{[]()
{
    WordsCompleter completer{test_words};
    StringOutputSink editor_sink, sink;
    LineEditor editor{editor_sink, "> "};
    CompletionEngine engine{completer, editor, sink, 30};

    auto start_selecting = [&] {
        editor.reset();
        editor.insert("g");
        engine.handle_key(CompletionKey::Trigger);
        engine.handle_key(CompletionKey::Trigger);
        tg_assert(engine.state() == CompletionState::Selecting and engine.choice() == 0);
        sink.clear();
    };

    // 3 columns, 4 candidates
    start_selecting();
    tg_assert(engine.handle_key(CompletionKey::Retreat) and engine.choice() == 3);
    tg_assert(engine.handle_key(CompletionKey::Advance) and engine.choice() == 0);
    tg_assert(engine.handle_key(CompletionKey::RowEnd) and engine.choice() == 2);
    tg_assert(engine.handle_key(CompletionKey::RowStart) and engine.choice() == 0);
    tg_assert(engine.handle_key(CompletionKey::Down) and engine.choice() == 3);
    tg_assert(engine.handle_key(CompletionKey::Up) and engine.choice() == 0);
    tg_assert(engine.handle_key(CompletionKey::Trigger) and engine.choice() == 1);
    tg_assert(sink.flush_count() == 7);
    tg_assert(engine.state() == CompletionState::Selecting);
    tg_assert(editor.line() == "g");

    // cancel keeps the line
    sink.clear();
    tg_assert(engine.handle_key(CompletionKey::Cancel));
    tg_assert(engine.state() == CompletionState::Idle and engine.choice() == -1);
    tg_assert(editor.line() == "g");
    tg_assert(sink.content() == erase_30);

    // back returns to the plain list and lets the editor handle the key
    start_selecting();
    tg_assert(not engine.handle_key(CompletionKey::Back));
    tg_assert(engine.state() == CompletionState::Listing and engine.choice() == -1);
    tg_assert(sink.content() == listing_30);
    tg_assert(engine.handle_key(CompletionKey::Trigger));
    tg_assert(engine.state() == CompletionState::Selecting and engine.choice() == 0);

    // any other key leaves completion and goes to the editor
    sink.clear();
    tg_assert(not engine.handle_key(CompletionKey::Unrecognized));
    tg_assert(engine.state() == CompletionState::Idle);
    tg_assert(editor.line() == "g");
    tg_assert(sink.content() == erase_30);

    // keys go through the keymap
    start_selecting();
    tg_assert(engine.handle_key(Key::Down) and engine.choice() == 3);
    tg_assert(engine.handle_key(ctrl('b')) and engine.choice() == 2);
    tg_assert(engine.handle_key(Key::Return));
    tg_assert(engine.state() == CompletionState::Idle);
    tg_assert(editor.line() == "git-shell" and editor.cursor_pos() == 9);
}};

UnitTest test_completion_engine_listing{[]()
{
    WordsCompleter completer{test_words};
    StringOutputSink editor_sink, sink;
    LineEditor editor{editor_sink, "> "};
    CompletionEngine engine{completer, editor, sink, 30};

    editor.insert("g");
    tg_assert(engine.handle_key(CompletionKey::Trigger));
    tg_assert(engine.state() == CompletionState::Listing);

    // editing keys are left to the editor, the list stays
    tg_assert(not engine.handle_key(CompletionKey::Unrecognized));
    tg_assert(not engine.handle_key(CompletionKey::Advance));
    tg_assert(engine.state() == CompletionState::Listing);
    editor.insert("r");

    // the line changed, fetch again: a single candidate remains
    sink.clear();
    tg_assert(engine.handle_key(CompletionKey::Trigger));
    tg_assert(completer.fetch_count == 2);
    tg_assert(engine.state() == CompletionState::Idle);
    tg_assert(editor.line() == "grep");
    tg_assert(sink.content() == "\r\n\033[J\033[1A\r\033[4C");

    // moving the cursor also starts a new session
    editor.reset();
    editor.insert("g");
    engine.handle_key(CompletionKey::Trigger);
    editor.insert(" ");
    editor.handle_key(Key::Left);
    tg_assert(engine.handle_key(CompletionKey::Trigger));
    tg_assert(completer.fetch_count == 4);
    tg_assert(engine.state() == CompletionState::Listing and engine.choice() == -1);
    tg_assert(engine.candidates()[0] == Candidate{"go ", "o"});

    // cancel erases the list
    sink.clear();
    tg_assert(engine.handle_key(CompletionKey::Cancel));
    tg_assert(engine.state() == CompletionState::Idle);
    tg_assert(sink.content() == erase_30);
    tg_assert(editor.line() == "g ");

    // resizing redraws on refresh only
    editor.reset();
    editor.insert("g");
    engine.handle_key(CompletionKey::Trigger);
    sink.clear();
    engine.on_width_change(40);
    tg_assert(sink.content().empty());
    engine.refresh();
    tg_assert(sink.content() == "\r\n\033[Jo        it       it-shell rep      \r\n\033[2A\r\033[3C");
}};

UnitTest test_completion_engine_splice{[]()
{
    StringOutputSink editor_sink, sink;
    LineEditor editor{editor_sink, ""};

    // text after the cursor is kept, only the middle is inserted
    WordsCompleter words{test_words};
    CompletionEngine engine{words, editor, sink, 30};
    editor.insert("g x");
    editor.handle_key(Key::Left);
    editor.handle_key(Key::Left);
    engine.handle_key(CompletionKey::Trigger);
    engine.handle_key(CompletionKey::Trigger);
    engine.handle_key(CompletionKey::Accept);
    tg_assert(editor.line() == "go x" and editor.cursor_pos() == 2);

    // unrelated lines replace the whole line
    FixedCompleter fixed{{{"xyz", "xyz"}, {"q", "q"}}};
    CompletionEngine replacing{fixed, editor, sink, 30};
    editor.reset();
    editor.insert("abc");
    editor.handle_key(Key::Left);
    editor.handle_key(Key::Left);
    replacing.handle_key(CompletionKey::Trigger);
    replacing.handle_key(CompletionKey::Trigger);
    replacing.handle_key(CompletionKey::Advance);
    replacing.handle_key(CompletionKey::Accept);
    tg_assert(editor.line() == "q" and editor.cursor_pos() == 1);

    // same line, nothing to insert
    FixedCompleter same{{{"ab", "ab"}, {"ab", "again"}}};
    CompletionEngine unchanged{same, editor, sink, 30};
    editor.reset();
    editor.insert("ab");
    unchanged.handle_key(CompletionKey::Trigger);
    unchanged.handle_key(CompletionKey::Trigger);
    unchanged.handle_key(CompletionKey::Accept);
    tg_assert(editor.line() == "ab" and editor.cursor_pos() == 2);
}};

UnitTest test_completion_scenario{[]()
{
    WordsCompleter completer{test_words};
    StringOutputSink editor_sink, sink;
    LineEditor editor{editor_sink, "> "};
    CompletionEngine engine{completer, editor, sink, 30};

    editor.insert("g");
    tg_assert(engine.handle_key(CompletionKey::Trigger));
    tg_assert(engine.state() == CompletionState::Listing);
    tg_assert(engine.candidates().size() == 4);
    tg_assert(engine.candidates()[2].display == "it-shell");
    tg_assert(sink.content() == listing_30);

    // redrawing the same state writes the same bytes
    sink.clear();
    engine.refresh();
    tg_assert(sink.content() == listing_30);

    sink.clear();
    tg_assert(engine.handle_key(CompletionKey::Trigger));
    tg_assert(engine.state() == CompletionState::Selecting and engine.choice() == 0);
    tg_assert(sink.content() == selecting_30);

    sink.clear();
    tg_assert(engine.handle_key(CompletionKey::Advance) and engine.choice() == 1);
    tg_assert(sink.content() == "\r\n\033[Jo        \033[30;47mit       \033[0mit-shell \r\nrep      \033[2A\r\033[3C");

    sink.clear();
    tg_assert(engine.handle_key(CompletionKey::Accept));
    tg_assert(engine.state() == CompletionState::Idle);
    tg_assert(editor.line() == "git" and editor.cursor_pos() == 3);
    tg_assert(sink.content() == erase_30);
    tg_assert(completer.fetch_count == 1);
}};


UnitTest test_completion_engine_zero_width{[]()
{
    WordsCompleter completer{test_words};
    StringOutputSink editor_sink, sink;
    LineEditor editor{editor_sink, "> "};
    CompletionEngine engine{completer, editor, sink, 30};

    // a list on screen is left as is while the width is 0
    editor.insert("g");
    engine.handle_key(CompletionKey::Trigger);
    tg_assert(engine.state() == CompletionState::Listing);
    sink.clear();
    engine.on_width_change(0);
    tg_assert(not engine.handle_key(CompletionKey::Trigger));
    tg_assert(not engine.handle_key(CompletionKey::Cancel));
    engine.refresh();
    tg_assert(engine.state() == CompletionState::Listing and engine.choice() == -1);
    tg_assert(sink.content().empty() and completer.fetch_count == 1);

    // same for a selection
    engine.on_width_change(30);
    tg_assert(engine.handle_key(CompletionKey::Trigger));
    tg_assert(engine.state() == CompletionState::Selecting and engine.choice() == 0);
    sink.clear();
    engine.on_width_change(0);
    tg_assert(not engine.handle_key(CompletionKey::Trigger));
    tg_assert(not engine.handle_key(CompletionKey::Advance));
    tg_assert(not engine.handle_key(CompletionKey::Down));
    tg_assert(not engine.handle_key(CompletionKey::Accept));
    tg_assert(not engine.handle_key(CompletionKey::Unrecognized));
    engine.refresh();
    tg_assert(engine.state() == CompletionState::Selecting and engine.choice() == 0);
    tg_assert(editor.line() == "g");
    tg_assert(sink.content().empty() and completer.fetch_count == 1);

    // the selection resumes once there is a width again
    engine.on_width_change(30);
    engine.refresh();
    tg_assert(sink.content() == selecting_30);
    sink.clear();
    engine.refresh();
    tg_assert(sink.content() == selecting_30);
    tg_assert(engine.handle_key(CompletionKey::Advance) and engine.choice() == 1);
    tg_assert(engine.handle_key(CompletionKey::Accept));
    tg_assert(editor.line() == "git");
}};

UnitTest test_completion_engine_word_list{[]()
{
    PrefixCompleterAdapter completer{std::make_unique<WordListCompleter>(test_words)};
    StringOutputSink editor_sink, sink;
    LineEditor editor{editor_sink, "> "};
    CompletionEngine engine{completer, editor, sink, 30};

    // labels are whole words, so two wider columns fit
    constexpr const char* rows = "go            git           \r\ngit-shell     grep          \r\n";
    editor.insert("g");
    tg_assert(engine.handle_key(CompletionKey::Trigger));
    tg_assert(engine.state() == CompletionState::Listing);
    tg_assert(engine.candidates()[2] == Candidate{"git-shell", "git-shell"});
    tg_assert(sink.content() == format("\r\n\033[J{}\033[3A\r\033[3C", rows));

    sink.clear();
    tg_assert(engine.handle_key(CompletionKey::Trigger) and engine.choice() == 0);
    tg_assert(sink.content() == "\r\n\033[J\033[30;47mgo            \033[0mgit           \r\n"
                                "git-shell     grep          \r\n\033[3A\r\033[3C");
    tg_assert(engine.handle_key(CompletionKey::Down) and engine.choice() == 2);
    tg_assert(engine.handle_key(CompletionKey::Accept));
    tg_assert(engine.state() == CompletionState::Idle);
    tg_assert(editor.line() == "git-shell" and editor.cursor_pos() == 9);

    // the common extension is written without a list
    editor.reset();
    editor.insert("gi");
    sink.clear();
    tg_assert(engine.handle_key(CompletionKey::Trigger));
    tg_assert(engine.state() == CompletionState::Idle);
    tg_assert(editor.line() == "git" and sink.content().empty());

    tg_assert(engine.handle_key(CompletionKey::Trigger));
    tg_assert(engine.state() == CompletionState::Listing);
    tg_assert(engine.candidates().size() == 2);
    tg_assert(engine.candidates()[1].display == "git-shell");
}};

UnitTest test_completion_engine_wrapped_line{[]()
{
    FixedCompleter completer{{{"x", "x"}, {"y", "y"}}};
    StringOutputSink editor_sink, sink;
    LineEditor editor{editor_sink, "> "};
    CompletionEngine engine{completer, editor, sink, 10};

    // editor and list share the width, both return to the second row
    editor.insert("abcdefghijk");
    editor.redraw(10);
    tg_assert(editor_sink.content() == "\r> abcdefghijk\033[J\r\033[3C");
    tg_assert(engine.handle_key(CompletionKey::Trigger));
    tg_assert(sink.content() == "\r\n\033[Jx y \033[1A\r\033[3C");
}};

}

#ifndef completion_engine_hh_INCLUDED
#define completion_engine_hh_INCLUDED

#include "candidate.hh"
#include "completion_keymap.hh"
#include "completion_renderer.hh"
#include "enum.hh"
#include "face.hh"
#include "line_buffer.hh"
#include "optional.hh"
#include "output_sink.hh"

namespace Tabgrid
{

enum class CompletionState
{
    Idle,
    Listing,
    Selecting,
};

constexpr auto enum_desc(Meta::Type<CompletionState>)
{
    return make_array<EnumDesc<CompletionState>>({
        { CompletionState::Idle, "idle" },
        { CompletionState::Listing, "listing" },
        { CompletionState::Selecting, "selecting" },
    });
}

struct CompletionOptions
{
    Face selected_face = { Color::Black, Color::White };
    CompletionKeymap keymap;
};

// Modal completion on top of a line buffer: a trigger lists the
// candidates of the completer, a second trigger on the same line
// starts browsing them as a grid.
class CompletionEngine
{
public:
    CompletionEngine(const Completer& completer, LineBuffer& buffer,
                     OutputSink& sink, ColumnCount width,
                     const CompletionOptions& options = {});

    // returns true when the key was used, false when it should be
    // handled by the line editor
    bool handle_key(CompletionKey key);
    bool handle_key(Key key) { return handle_key(m_keymap.lookup(key)); }

    // the next refresh uses the new width
    void on_width_change(ColumnCount width);
    // redraws the candidate grid if one is shown
    void refresh();

    CompletionState state() const { return m_state; }
    // -1 unless selecting
    int choice() const { return m_session ? m_session->choice : -1; }
    ConstArrayView<Candidate> candidates() const;
    ColumnCount width() const { return m_width; }
    const CompletionKeymap& keymap() const { return m_keymap; }

private:
    struct Session
    {
        String source_line;
        CharCount source_pos;
        CandidateList candidates;
        int choice = -1;
        int columns = 0;
        bool drawn = false;
    };

    void trigger();
    void select_next();
    bool handle_selecting_key(CompletionKey key);

    void set_state(CompletionState state);
    // leaves completion, writing chosen in the line if given
    void exit_completion(const Candidate* chosen);
    void splice(const Session& session, const Candidate& candidate);

    const Completer& m_completer;
    LineBuffer& m_buffer;
    CompletionRenderer m_renderer;
    CompletionKeymap m_keymap;
    ColumnCount m_width;

    CompletionState m_state = CompletionState::Idle;
    Optional<Session> m_session;
};

}

#endif // completion_engine_hh_INCLUDED

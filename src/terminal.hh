#ifndef terminal_hh_INCLUDED
#define terminal_hh_INCLUDED

#include "keys.hh"
#include "optional.hh"
#include "units.hh"
#include "utils.hh"

#include <termios.h>

namespace Tabgrid
{

// decodes the key starting with byte first, next_char returns the
// following bytes when they are already available
Optional<Key> decode_key(unsigned char first,
                         FunctionRef<Optional<unsigned char>()> next_char,
                         unsigned char erase_char = 127);

// Puts the controlling terminal in raw mode for the lifetime of the object
class Terminal
{
public:
    Terminal();
    ~Terminal();

    Terminal(const Terminal&) = delete;
    Terminal& operator=(const Terminal&) = delete;

    ColumnCount width() const { return m_width; }

    // updates the width if a resize was signaled, returns true if it changed
    bool check_resize(bool force = false);

    // waits for the next key, returns Key::Invalid when interrupted by a
    // signal and nothing once the input is closed
    Optional<Key> read_key();

private:
    void set_raw_mode() const;

    termios m_original_termios;
    ColumnCount m_width = 80;
    bool m_stdin_closed = false;
};

}

#endif // terminal_hh_INCLUDED

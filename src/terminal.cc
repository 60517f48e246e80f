#include "terminal.hh"

#include "exception.hh"
#include "file.hh"
#include "format.hh"
#include "unit_tests.hh"
#include "utf8.hh"

#include <algorithm>
#include <csignal>
#include <cerrno>
#include <cstring>

#include <sys/ioctl.h>
#include <unistd.h>

namespace Tabgrid
{

static volatile sig_atomic_t resize_pending = 0;

static void resize_handler(int)
{
    resize_pending = 1;
}

// without SA_RESTART, so that a pending read returns on resize
static void set_signal_handler(int signum, void (*handler)(int))
{
    struct sigaction action{};
    action.sa_handler = handler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(signum, &action, nullptr);
}

static Key::Modifiers parse_mask(int mask)
{
    Key::Modifiers mod = Key::Modifiers::None;
    if (mask & 1)
        mod |= Key::Modifiers::Shift;
    if (mask & 2)
        mod |= Key::Modifiers::Alt;
    if (mask & 4)
        mod |= Key::Modifiers::Control;
    return mod;
}

Optional<Key> decode_key(unsigned char first,
                         FunctionRef<Optional<unsigned char>()> next_char,
                         unsigned char erase_char)
{
    static constexpr auto control = [](char c) { return c & 037; };

    auto convert = [erase_char](Codepoint c) -> Codepoint {
        if (c == control('m') or c == control('j'))
            return Key::Return;
        if (c == control('i'))
            return Key::Tab;
        if (c == ' ')
            return Key::Space;
        if (c == erase_char)
            return Key::Backspace;
        if (c == 127) // when it's not backspace
            return Key::Delete;
        if (c == 27)
            return Key::Escape;
        return c;
    };

    auto parse_key = [&](unsigned char c) -> Key {
        if (Codepoint cp = convert(c); cp > 255)
            return Key{cp};
        if (c == 0)
            return ctrl(Key::Space);
        // ctrl-letters are lower case, ctrl-symbols upper case
        if (c < 27)
            return ctrl(c - 1 + 'a');
        if (c < 32)
            return ctrl(c - 1 + 'A');

        char bytes[4] = { (char)c };
        const int size = std::min((int)utf8::codepoint_size(c), 4);
        for (int i = 1; i < size; ++i)
            bytes[i] = (char)next_char().value_or((unsigned char)0);
        return Key{utf8::codepoint(bytes, bytes + size)};
    };

    auto parse_csi = [&]() -> Optional<Key> {
        auto next = [&] { return next_char().value_or((unsigned char)0xff); };
        int params[4] = {};
        int count = 0;
        auto c = next();
        for (; c >= 0x30 and c <= 0x3f; c = next())
        {
            if (c >= '0' and c <= '9')
                params[count] = params[count] * 10 + c - '0';
            else if (c == ';' and count < 3)
                ++count;
            else
                return {};
        }

        auto masked_key = [&](Codepoint key) {
            return Key{parse_mask(std::max(params[1] - 1, 0)), key};
        };

        switch (c)
        {
        case 'A': return masked_key(Key::Up);
        case 'B': return masked_key(Key::Down);
        case 'C': return masked_key(Key::Right);
        case 'D': return masked_key(Key::Left);
        case 'F': return masked_key(Key::End);
        case 'H': return masked_key(Key::Home);
        case 'Z': return shift(Key::Tab);
        case '~':
            switch (params[0])
            {
            case 1: case 7: return masked_key(Key::Home);
            case 2: return masked_key(Key::Insert);
            case 3: return masked_key(Key::Delete);
            case 4: case 8: return masked_key(Key::End);
            case 5: return masked_key(Key::PageUp);
            case 6: return masked_key(Key::PageDown);
            }
            return {};
        }
        return {};
    };

    auto parse_ss3 = [&]() -> Optional<Key> {
        switch (next_char().value_or((unsigned char)0xff))
        {
        case 'A': return Key{Key::Up};
        case 'B': return Key{Key::Down};
        case 'C': return Key{Key::Right};
        case 'D': return Key{Key::Left};
        case 'F': return Key{Key::End};
        case 'H': return Key{Key::Home};
        case 'M': return Key{Key::Return};
        default: return {};
        }
    };

    if (first != 27)
        return parse_key(first);

    if (auto next = next_char())
    {
        if (*next == '[')
            return parse_csi().value_or(alt('['));
        if (*next == 'O')
            return parse_ss3().value_or(alt('O'));
        return alt(parse_key(*next));
    }
    return Key{Key::Escape};
}

Terminal::Terminal()
{
    if (not isatty(STDIN_FILENO) or not isatty(STDOUT_FILENO))
        throw runtime_error("stdin and stdout must be terminals");

    if (tcgetattr(STDIN_FILENO, &m_original_termios) != 0)
        throw runtime_error(format("unable to read terminal attributes: {}", strerror(errno)));

    set_raw_mode();
    set_signal_handler(SIGWINCH, resize_handler);
    check_resize(true);
}

Terminal::~Terminal()
{
    tcsetattr(STDIN_FILENO, TCSAFLUSH, &m_original_termios);
    set_signal_handler(SIGWINCH, SIG_DFL);
}

void Terminal::set_raw_mode() const
{
    termios attr = m_original_termios;
    attr.c_iflag &= ~(IGNBRK | BRKINT | PARMRK | ISTRIP | INLCR | IGNCR | ICRNL | IXON);
    attr.c_oflag &= ~OPOST;
    attr.c_lflag &= ~(ECHO | ECHONL | ICANON | ISIG | IEXTEN);
    attr.c_lflag |= NOFLSH;
    attr.c_cflag &= ~(CSIZE | PARENB);
    attr.c_cflag |= CS8;
    attr.c_cc[VMIN] = 1;
    attr.c_cc[VTIME] = 0;

    if (tcsetattr(STDIN_FILENO, TCSANOW, &attr) != 0)
        throw runtime_error(format("unable to set raw mode: {}", strerror(errno)));
}

bool Terminal::check_resize(bool force)
{
    if (not force and not resize_pending)
        return false;

    resize_pending = 0;

    ColumnCount width = 80;
    if (winsize ws; ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 and ws.ws_col > 0)
        width = ws.ws_col;

    const bool changed = width != m_width;
    m_width = width;
    return changed;
}

Optional<Key> Terminal::read_key()
{
    if (m_stdin_closed)
        return {};

    unsigned char c = 0;
    if (const ssize_t res = ::read(STDIN_FILENO, &c, 1); res != 1)
    {
        if (res < 0 and errno == EINTR)
            return Key{Key::Invalid};
        m_stdin_closed = true;
        return {};
    }

    auto next_char = []() -> Optional<unsigned char> {
        if (not fd_readable(STDIN_FILENO))
            return {};
        if (unsigned char c = 0; ::read(STDIN_FILENO, &c, 1) == 1)
            return c;
        return {};
    };
    return decode_key(c, next_char, m_original_termios.c_cc[VERASE]);
}

UnitTest test_decode_key{[]()
{
    auto decode = [](StringView bytes) {
        auto it = bytes.begin();
        auto next_char = [&]() -> Optional<unsigned char> {
            if (it == bytes.end())
                return {};
            return (unsigned char)*it++;
        };
        const unsigned char first = *it++;
        auto key = decode_key(first, next_char);
        tg_assert(it == bytes.end());
        return key;
    };

    tg_assert(decode("\t") == Key{Key::Tab});
    tg_assert(decode("\r") == Key{Key::Return});
    tg_assert(decode("\x7f") == Key{Key::Backspace});
    tg_assert(decode("\x01") == ctrl('a'));
    tg_assert(decode("\x0e") == ctrl('n'));
    tg_assert(decode("a") == Key{'a'});
    tg_assert(decode(" ") == Key{Key::Space});
    tg_assert(decode("é") == Key{0xe9});
    tg_assert(decode("\033") == Key{Key::Escape});
    tg_assert(decode("\033x") == alt('x'));
    tg_assert(decode("\033[A") == Key{Key::Up});
    tg_assert(decode("\033[D") == Key{Key::Left});
    tg_assert(decode("\033[1;5C") == ctrl(Key::Right));
    tg_assert(decode("\033[H") == Key{Key::Home});
    tg_assert(decode("\033[4~") == Key{Key::End});
    tg_assert(decode("\033[3~") == Key{Key::Delete});
    tg_assert(decode("\033[Z") == shift(Key::Tab));
    tg_assert(decode("\033OB") == Key{Key::Down});
}};

}

#include "candidate.hh"
#include "completion_engine.hh"
#include "debug.hh"
#include "face.hh"
#include "file.hh"
#include "format.hh"
#include "line_editor.hh"
#include "output_sink.hh"
#include "parameters_parser.hh"
#include "string.hh"
#include "string_utils.hh"
#include "terminal.hh"
#include "unit_tests.hh"

#include <fcntl.h>
#include <locale.h>
#include <unistd.h>

#include <memory>

namespace Tabgrid
{

inline void write_stdout(StringView str) { try { write(STDOUT_FILENO, str); } catch (runtime_error&) {} }
inline void write_stderr(StringView str) { try { write(STDERR_FILENO, str); } catch (runtime_error&) {} }

static bool log_to_file = false;

void report_error(StringView message)
{
    write_stderr(format("error: {}\n", message));
    if (log_to_file)
        write_to_debug_log(format("error: {}", message));
}

String generate_keymap_doc(const CompletionKeymap& keymap)
{
    String res;
    for (auto& desc : enum_desc(Meta::Type<CompletionKey>{}))
    {
        Vector<String> keys;
        for (auto key : keymap.get_mapped_keys(desc.value))
            keys.push_back(to_string(key));
        res += format("  {} {}\n", right_pad(desc.name, 10_col), join(keys, " "));
    }
    return res;
}

int run_tests()
{
#ifdef TABGRID_DEBUG
    UnitTest::run_all_tests();
    write_stdout("all tests passed\n");
    return 0;
#else
    write_stderr("unit tests are only available in debug builds\n");
    return -1;
#endif
}

std::unique_ptr<Completer> make_completer(Vector<String> words)
{
    if (words.empty())
        return std::make_unique<PrefixCompleterAdapter>(std::make_unique<TabCompleter>());
    return std::make_unique<PrefixCompleterAdapter>(
        std::make_unique<WordListCompleter>(std::move(words)));
}

int run_editor(const Completer& completer, const CompletionOptions& options,
               StringView prompt, Optional<ColumnCount> fixed_width)
{
    Terminal terminal;
    FdOutputSink output{STDOUT_FILENO};
    LineEditor editor{output, prompt.str()};
    // the line and the list must wrap at the same width
    auto width = [&] { return fixed_width.value_or(terminal.width()); };
    CompletionEngine engine{completer, editor, output, width(), options};
    const bool log_keys = (bool)(debug_flags() & DebugFlags::Keys);

    auto redraw = [&] {
        editor.redraw(width());
        engine.refresh();
    };

    auto finish_line = [&](StringView suffix) {
        if (engine.state() != CompletionState::Idle)
            engine.handle_key(CompletionKey::Cancel);
        editor.handle_key(Key::End);
        editor.redraw(width());

        BufferedWriter<> writer{STDOUT_FILENO};
        writer.write(suffix);
        writer.write("\r\n");
    };

    editor.redraw(width());
    while (auto key = terminal.read_key())
    {
        if (terminal.check_resize())
        {
            if (not fixed_width)
                engine.on_width_change(width());
            redraw();
        }
        if (*key == Key::Invalid)
            continue;

        const CompletionKey action = engine.keymap().lookup(*key);
        if (log_keys)
            write_to_debug_log(format("key: {} -> {}", to_string(*key),
                                      action == CompletionKey::Unrecognized ? "none" : enum_name(action)));

        if (engine.handle_key(action))
        {
            if (editor.dirty())
                editor.redraw(width());
            continue;
        }

        if (*key == Key::Return or *key == ctrl('j'))
        {
            finish_line({});
            write_stdout(format("{}\r\n", editor.line()));
            editor.reset();
            editor.redraw(width());
        }
        else if (*key == ctrl('c'))
        {
            finish_line("^C");
            editor.reset();
            editor.redraw(width());
        }
        else if (*key == ctrl('d') and editor.line().empty())
            break;
        else if (editor.handle_key(*key))
            redraw();
    }

    write_stdout("\r\n");
    return 0;
}

}

int main(int argc, char* argv[])
{
    using namespace Tabgrid;

    setlocale(LC_ALL, "");

    const ParameterDesc param_desc{
        SwitchMap{ { "words", { true, "read completion words from the given file" } },
                   { "prompt", { true, "set the prompt text" } },
                   { "select-face", { true, "face of the selected candidate" } },
                   { "map", { true, "key bindings as <keys>=<action>;..." } },
                   { "width", { true, "use a fixed width instead of the terminal one" } },
                   { "debug", { true, "debug flags (keys|completion)" } },
                   { "log", { true, "write the debug log to the given file" } },
                   { "run-tests", { false, "run the unit tests and exit" } },
                   { "help", { false, "display a help message and quit" } } }
    };

    int log_fd = -1;
    auto close_log = on_scope_end([&] { if (log_fd >= 0) close(log_fd); });

    try
    {
        auto show_usage = [&]()
        {
            write_stdout(format("Usage: {} [options] [word]...\n\n"
                    "Options:\n"
                    "{}\n"
                    "Completion keys:\n"
                    "{}\n"
                    "Words given as arguments are completed along with the ones of -words,\n"
                    "a tab is inserted when there is none\n",
                    argv[0], generate_switches_doc(param_desc.switches),
                    generate_keymap_doc(CompletionKeymap{})));
            return 0;
        };

        Vector<String> params;
        for (int i = 1; i < argc; ++i)
            params.emplace_back(argv[i]);

        ParametersParser parser{params, param_desc};

        if (parser.get_switch("help"))
            return show_usage();

        if (auto log_file = parser.get_switch("log"))
        {
            log_fd = open_append(*log_file);
            set_debug_log_fd(log_fd);
            log_to_file = true;
        }
        if (auto flags = parser.get_switch("debug"))
            set_debug_flags(flags_from_string<DebugFlags>(*flags));

        if (parser.get_switch("run-tests"))
            return run_tests();

#ifdef TABGRID_DEBUG
        UnitTest::run_all_tests();
#endif

        CompletionOptions options;
        if (auto face = parser.get_switch("select-face"))
            options.selected_face = parse_face(*face);
        if (auto mappings = parser.get_switch("map"))
            options.keymap.parse_mappings(*mappings);

        Optional<ColumnCount> fixed_width;
        if (auto width = parser.get_switch("width"))
        {
            const int value = str_to_int(*width);
            if (value < 0)
                throw runtime_error(format("invalid width {}", value));
            fixed_width = ColumnCount{value};
        }

        Vector<String> words;
        if (auto words_file = parser.get_switch("words"))
        {
            const String content = read_file(*words_file);
            for (auto word : split_words(content))
                words.push_back(word.str());
        }
        for (auto& word : parser)
            words.push_back(word);

        auto completer = make_completer(std::move(words));
        return run_editor(*completer, options,
                          parser.get_switch("prompt").value_or("> "), fixed_width);
    }
    catch (parameter_error& error)
    {
        write_stderr(format("Error while parsing parameters: {}\n"
                            "Valid switches:\n"
                            "{}", error.what(),
                            generate_switches_doc(param_desc.switches)));
       return -1;
    }
    catch (Tabgrid::exception& error)
    {
        report_error(error.what());
        return -1;
    }
    catch (std::exception& error)
    {
        report_error(error.what());
        return -1;
    }
    return 0;
}

#ifndef output_sink_hh_INCLUDED
#define output_sink_hh_INCLUDED

#include "file.hh"
#include "string.hh"

namespace Tabgrid
{

class OutputSink
{
public:
    virtual ~OutputSink() = default;

    virtual void write(StringView data) = 0;
    virtual void flush() = 0;
};

// buffers until flushed, so each redraw reaches the terminal in one write
class FdOutputSink : public OutputSink
{
public:
    FdOutputSink(int fd) : m_fd{fd} {}

    void write(StringView data) override { m_buffer += data; }
    void flush() override
    {
        auto clear_buffer = on_scope_end([this] { m_buffer.clear(); });
        Tabgrid::write(m_fd, m_buffer);
    }

private:
    int m_fd;
    String m_buffer;
};

// keeps everything written, used to check the exact terminal output
class StringOutputSink : public OutputSink
{
public:
    void write(StringView data) override { m_pending += data; }
    void flush() override { m_content += m_pending; m_pending.clear(); ++m_flush_count; }

    const String& content() const { return m_content; }
    int flush_count() const { return m_flush_count; }
    void clear() { m_content.clear(); m_pending.clear(); m_flush_count = 0; }

private:
    String m_content;
    String m_pending;
    int m_flush_count = 0;
};

}

#endif // output_sink_hh_INCLUDED

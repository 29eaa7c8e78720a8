// main.cpp
// Reads a JSON document from a file or stdin and writes its compact form to stdout.
// With --events the event stream is printed instead, one event per line.
#include <JEVT/IO/File.hpp>
#include <JEVT/Serialization/JSON/JsonEvent.hpp>
#include <JEVT/Serialization/JSON/JsonReader.hpp>
#include <JEVT/Serialization/JSON/JsonWriter.hpp>

#include <iostream>
#include <string>
#include <string_view>

#if defined(_WIN32)
#define NOMINMAX
#include <windows.h>
#endif

using namespace JEVT;
using namespace JEVT::Serialization;

namespace
{
    IO::File::NativeHandle StandardInput()
    {
#if defined(_WIN32)
        return GetStdHandle(STD_INPUT_HANDLE);
#else
        return 0;
#endif
    }

    IO::File::NativeHandle StandardOutput()
    {
#if defined(_WIN32)
        return GetStdHandle(STD_OUTPUT_HANDLE);
#else
        return 1;
#endif
    }

    int PrintUsage(std::ostream& out)
    {
        out << "usage: JEVT.Canonicalize [--events] [file]\n"
               "  Reads stdin when no file (or '-') is given.\n";
        return 2;
    }

    int Report(const JsonError& error)
    {
        std::cerr << "[Canonicalize] " << error.ToString() << "\n";
        return 1;
    }

    int PrintEvents(JsonStreamReader<IO::File>& reader)
    {
        while (true)
        {
            auto event = reader.ReadNextEvent();
            if (!event)
                return Report(event.error());
            std::cout << ToString(*event) << "\n";
            if (event->IsEof())
                return 0;
        }
    }

    int Canonicalize(JsonStreamReader<IO::File>& reader, IO::File& output)
    {
        JsonStreamWriter<IO::File> writer {output};
        while (true)
        {
            auto event = reader.ReadNextEvent();
            if (!event)
                return Report(event.error());
            auto written = writer.WriteEvent(*event);
            if (!written)
                return Report(written.error());
            if (event->IsEof())
                break;
        }
        auto finished = writer.Finish();
        if (!finished)
            return Report(finished.error());
        return 0;
    }
}// namespace

int main(int argc, char** argv)
{
    bool        printEvents = false;
    std::string path;
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg {argv[i]};
        if (arg == "--events")
        {
            printEvents = true;
        }
        else if (arg == "-h" || arg == "--help")
        {
            PrintUsage(std::cout);
            return 0;
        }
        else if (!path.empty() || (arg.size() > 1 && arg.front() == '-'))
        {
            return PrintUsage(std::cerr);
        }
        else
        {
            path = arg;
        }
    }

    const bool useStdin = path.empty() || path == "-";
    IO::File   input;
    if (useStdin)
    {
        input = IO::File {StandardInput()};
    }
    else
    {
        auto opened = input.Open(path, IO::File::OpenMode::Read);
        if (!opened)
        {
            std::cerr << "[Canonicalize] Cannot open '" << path << "': " << opened.error().message << "\n";
            return 1;
        }
    }

    JsonStreamReader<IO::File> reader {input};
    int                        status = 0;
    if (printEvents)
    {
        status = PrintEvents(reader);
    }
    else
    {
        IO::File output {StandardOutput()};
        status = Canonicalize(reader, output);
        output.Release();
    }

    if (useStdin)
        input.Release();
    return status;
}

#include "i2pbase/cli.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "i2pbase/codec.hpp"
#include "i2pbase/stream.hpp"

namespace i2pbase
{

namespace
{

constexpr const char* kUsage =
    "Usage: i2pbase <encode|decode> [--input <path> | --string <text>] [--output <path>]"
    " [--ignore-whitespace] [--allow-unpadded]";

void select_input(Options& opts, InputKind kind, bool& selected)
{
    if (selected)
    {
        throw std::runtime_error("Only one of --input and --string may be given");
    }
    selected = true;
    opts.input = kind;
}

}  // namespace

Options parse_args(const std::vector<std::string>& args)
{
    if (args.empty())
    {
        throw std::runtime_error(kUsage);
    }

    Options opts;
    const std::string& mode = args[0];
    if (mode == "encode")
    {
        opts.mode = Mode::Encode;
    }
    else if (mode == "decode")
    {
        opts.mode = Mode::Decode;
    }
    else
    {
        throw std::runtime_error("First argument must be 'encode' or 'decode'");
    }

    bool input_selected = false;
    bool output_selected = false;
    for (std::size_t i = 1; i < args.size(); ++i)
    {
        const std::string& tok = args[i];
        auto require_value = [&](const char* flag) -> const std::string&
        {
            if (i + 1 >= args.size())
            {
                throw std::runtime_error(std::string("Missing value for ") + flag);
            }
            return args[++i];
        };

        if (tok == "--input" || tok == "-i")
        {
            select_input(opts, InputKind::File, input_selected);
            opts.input_path = require_value(tok.c_str());
            if (opts.input_path.empty())
            {
                throw std::runtime_error("Input path must not be empty");
            }
        }
        else if (tok == "--string" || tok == "-s")
        {
            select_input(opts, InputKind::Inline, input_selected);
            opts.inline_text = require_value(tok.c_str());
        }
        else if (tok == "--output" || tok == "-o")
        {
            if (output_selected)
            {
                throw std::runtime_error("--output given more than once");
            }
            output_selected = true;
            opts.output_path = require_value(tok.c_str());
            if (opts.output_path.empty())
            {
                throw std::runtime_error("Output path must not be empty");
            }
        }
        else if (tok == "--ignore-whitespace" || tok == "-w")
        {
            opts.ignore_whitespace = true;
        }
        else if (tok == "--allow-unpadded" || tok == "-u")
        {
            opts.allow_unpadded = true;
        }
        else
        {
            throw std::runtime_error("Unknown option: " + tok);
        }
    }

    if (opts.mode == Mode::Encode && (opts.ignore_whitespace || opts.allow_unpadded))
    {
        throw std::runtime_error("--ignore-whitespace and --allow-unpadded apply to decode only");
    }

    return opts;
}

void run(const Options& options, std::istream& in, std::ostream& out)
{
    std::unique_ptr<Source> source;
    switch (options.input)
    {
        case InputKind::File:
            source = std::make_unique<FileSource>(options.input_path);
            break;
        case InputKind::Inline:
            source = std::make_unique<MemorySource>(options.inline_text);
            break;
        case InputKind::Stdin:
            source = std::make_unique<StreamSource>(in);
            break;
    }

    std::unique_ptr<Sink> sink;
    if (options.output_path.empty())
    {
        sink = std::make_unique<StreamSink>(out);
    }
    else
    {
        sink = std::make_unique<FileSink>(options.output_path);
    }

    if (options.mode == Mode::Encode)
    {
        encode(*source, *sink);
    }
    else
    {
        DecodeOptions decode_options;
        decode_options.ignore_whitespace = options.ignore_whitespace;
        decode_options.allow_unpadded = options.allow_unpadded;
        decode(*source, *sink, decode_options);
    }
}

}  // namespace i2pbase

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <sodium.h>
#include <string>
#include <unordered_map>
#include <vector>

#include "proto/call.hpp"
#include "proto/call_lazy.hpp"
#include "util/constants.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

namespace
{

struct Options
{
    std::size_t overhead  = constants::FRAME_OVERHEAD;
    std::size_t max_frame = constants::MAX_FRAME_SIZE;
};

static void print_usage()
{
    std::fprintf(stderr,
                 "Usage:\n"
                 "  tchan-dump [--overhead N] [--max-frame N] <command> [args]\n"
                 "\n"
                 "Commands:\n"
                 "  req <hex>           decode a call request frame, verify its checksum\n"
                 "  res <hex>           decode a call response frame, verify its checksum\n"
                 "  lazy-req <hex>      read request fields without a full decode\n"
                 "  lazy-res <hex>      read response fields without a full decode\n"
                 "  terminal <hex>      tell whether the frame ends its argument stream\n"
                 "  encode-req <service> <ttl> [--csum none|crc32|crc32c] [--header k=v]... "
                 "[arg...]\n"
                 "  encode-res <ok|error> [--csum none|crc32|crc32c] [--header k=v]... [arg...]\n"
                 "\n"
                 "<hex> is the whole frame, envelope included.\n");
}

static bool parse_size(const char *s, std::size_t &out)
{
    // strtoul would take "-1" as ULONG_MAX
    if (!std::isdigit(static_cast<unsigned char>(s[0])))
        return false;
    errno             = 0;
    char         *end = nullptr;
    unsigned long v   = std::strtoul(s, &end, 10);
    if (*end != '\0' || errno == ERANGE)
        return false;
    out = static_cast<std::size_t>(v);
    return true;
}

static bool from_hex(const std::string &hex, wire::Buffer &out)
{
    out.resize(hex.size() / 2 + 1);
    std::size_t bin_len = 0;
    const char *end     = nullptr;
    if (sodium_hex2bin(out.data(), out.size(), hex.c_str(), hex.size(), " :", &bin_len, &end) !=
            0 ||
        (end && *end != '\0'))
    {
        return false;
    }
    out.resize(bin_len);
    return true;
}

static std::string to_hex(const wire::Buffer &bin)
{
    std::string hex(bin.size() * 2 + 1, '\0');
    sodium_bin2hex(&hex[0], hex.size(), bin.data(), bin.size());
    hex.resize(bin.size() * 2);
    return hex;
}

static void print_bytes(const char *label, const wire::Bytes &b)
{
    if (args::strrw::is_printable(b.data(), b.size()))
        std::printf("%s: \"%.*s\"\n", label, static_cast<int>(b.size()),
                    reinterpret_cast<const char *>(b.data()));
    else
        std::printf("%s: 0x%s\n", label, to_hex(b).c_str());
}

static void print_tracing(const tracing::Tracing &t)
{
    std::printf("tracing: span=%016llx parent=%016llx trace=%016llx flags=0x%02x\n",
                static_cast<unsigned long long>(t.span_id),
                static_cast<unsigned long long>(t.parent_id),
                static_cast<unsigned long long>(t.trace_id), t.flags);
}

static void print_common(std::uint8_t flags, const header::HeaderMap &headers,
                         const checksum::Checksum &csum, const args::Args &list)
{
    for (const auto &h : headers)
        std::printf("header: %s=%s\n", h.first.c_str(), h.second.c_str());
    std::printf("csum: %s 0x%08x\n", checksum::type_name(csum.type), csum.value);
    for (std::size_t i = 0; i < list.size(); ++i)
    {
        std::string label = "arg" + std::to_string(i + 1);
        print_bytes(label.c_str(), list[i]);
    }
    std::printf("terminal: %s\n", call_flags::is_fragment(flags) ? "no" : "yes");
}

static int report(const wire::Error &e, int code)
{
    std::fprintf(stderr, "error: %s\n", wire::describe(e).c_str());
    return code;
}

static int check_csum(const std::optional<wire::Error> &err)
{
    if (!err)
    {
        std::printf("csum-ok: yes\n");
        return exitc::ok;
    }
    std::printf("csum-ok: no\n");
    return report(*err, err->code == wire::Errc::checksum_mismatch ? exitc::checksum_mismatch
                                                                   : exitc::decode_error);
}

static int cmd_req(const Options &o, const wire::Buffer &buf)
{
    auto res = call::read_request(buf, o.overhead);
    if (!res.ok())
        return report(*res.err, exitc::decode_error);
    const auto &b = res.value;
    std::printf("flags: 0x%02x\nttl: %u\n", b.flags, b.ttl);
    print_tracing(b.trace);
    std::printf("service: %s\n", b.service.c_str());
    print_common(b.flags, b.headers, b.csum, b.args);
    return check_csum(b.verify_checksum());
}

static int cmd_res(const Options &o, const wire::Buffer &buf)
{
    auto res = call::read_response(buf, o.overhead);
    if (!res.ok())
        return report(*res.err, exitc::decode_error);
    const auto &b = res.value;
    std::printf("flags: 0x%02x\ncode: %s\n", b.flags,
                b.code == call::ResponseCode::Ok ? "ok" : "error");
    print_tracing(b.trace);
    print_common(b.flags, b.headers, b.csum, b.args);
    return check_csum(b.verify_checksum());
}

static int cmd_lazy_req(const Options &o, wire::Buffer buf)
{
    frame::Frame        f(std::move(buf), o.overhead);
    call::RequestReader r(f);

    auto flags = r.read_flags();
    if (!flags.ok())
        return report(*flags.err, exitc::decode_error);
    auto ttl = r.read_ttl();
    if (!ttl.ok())
        return report(*ttl.err, exitc::decode_error);
    auto service = r.read_service();
    if (!service.ok())
        return report(*service.err, exitc::decode_error);
    auto caller = r.read_caller_name();
    if (!caller.ok())
        return report(*caller.err, exitc::decode_error);
    auto arg1 = r.read_arg1();
    if (!arg1.ok())
        return report(*arg1.err, exitc::decode_error);

    std::printf("flags: 0x%02x\nttl: %u\nservice: %s\ncaller: %s\n", flags.value, ttl.value,
                service.value.c_str(), caller.value.c_str());
    print_bytes("arg1", arg1.value);
    return exitc::ok;
}

static int cmd_lazy_res(const Options &o, wire::Buffer buf)
{
    frame::Frame         f(std::move(buf), o.overhead);
    call::ResponseReader r(f);

    auto flags = r.read_flags();
    if (!flags.ok())
        return report(*flags.err, exitc::decode_error);
    auto code = r.read_code();
    if (!code.ok())
        return report(*code.err, exitc::decode_error);
    auto headers = r.read_headers();
    if (!headers.ok())
        return report(*headers.err, exitc::decode_error);
    auto arg1 = r.read_arg1();
    if (!arg1.ok())
        return report(*arg1.err, exitc::decode_error);

    std::printf("flags: 0x%02x\ncode: %s\nheaders: %zu\n", flags.value,
                code.value == call::ResponseCode::Ok ? "ok" : "error", headers.value.count());
    print_bytes("arg1", arg1.value);
    return exitc::ok;
}

static int cmd_terminal(const Options &o, wire::Buffer buf)
{
    frame::Frame f(std::move(buf), o.overhead);
    // the flags byte sits at the same place in both kinds
    auto res = call::RequestReader(f).is_frame_terminal();
    if (!res.ok())
        return report(*res.err, exitc::decode_error);
    std::printf("%s\n", res.value ? "terminal" : "fragment");
    return exitc::ok;
}

// [--csum T] [--header k=v]... [arg...]
static bool parse_body_args(const std::vector<std::string> &in, std::size_t from,
                            checksum::Checksum &csum, header::HeaderMap &headers,
                            args::Args &list)
{
    for (std::size_t i = from; i < in.size(); ++i)
    {
        const std::string &a = in[i];
        if (a == "--csum" && i + 1 < in.size())
        {
            const std::string &t = in[++i];
            if (t == "none")
                csum.type = checksum::Type::None;
            else if (t == "crc32")
                csum.type = checksum::Type::Crc32;
            else if (t == "crc32c")
                csum.type = checksum::Type::Crc32C;
            else
            {
                std::fprintf(stderr, "error: unknown checksum type: %s\n", t.c_str());
                return false;
            }
        }
        else if (a == "--header" && i + 1 < in.size())
        {
            const std::string &kv = in[++i];
            auto               eq = kv.find('=');
            if (eq == std::string::npos)
            {
                std::fprintf(stderr, "error: header must be key=value: %s\n", kv.c_str());
                return false;
            }
            headers.set(kv.substr(0, eq), kv.substr(eq + 1));
        }
        else
        {
            list.emplace_back(a.begin(), a.end());
        }
    }
    return true;
}

template <typename B>
static int emit(const Options &o, B &body)
{
    frame::Frame f;
    f.overhead = o.overhead;
    f.buffer.assign(o.overhead, 0);

    auto res = call::encode(body, f, o.max_frame);
    if (!res.ok())
        return report(*res.err, exitc::encode_error);
    if (call_flags::is_fragment(body.flags))
        LOG_INFO("arguments did not fit in %zu bytes, frame carries FRAGMENT", o.max_frame);
    std::printf("%s\n", to_hex(f.buffer).c_str());
    return exitc::ok;
}

static int cmd_encode_req(const Options &o, const std::vector<std::string> &a)
{
    if (a.size() < 3)
    {
        print_usage();
        return exitc::bad_args;
    }
    call::RequestBody body;
    body.service = a[1];
    std::size_t ttl = 0;
    if (!parse_size(a[2].c_str(), ttl) || ttl > 0xFFFFFFFFu)
    {
        std::fprintf(stderr, "error: invalid ttl: %s\n", a[2].c_str());
        return exitc::bad_args;
    }
    body.ttl   = static_cast<std::uint32_t>(ttl);
    body.trace = tracing::root();
    if (!parse_body_args(a, 3, body.csum, body.headers, body.args))
        return exitc::bad_args;
    return emit(o, body);
}

static int cmd_encode_res(const Options &o, const std::vector<std::string> &a)
{
    if (a.size() < 2 || (a[1] != "ok" && a[1] != "error"))
    {
        print_usage();
        return exitc::bad_args;
    }
    call::ResponseBody body;
    body.code = a[1] == "ok" ? call::ResponseCode::Ok : call::ResponseCode::Error;
    if (!parse_body_args(a, 2, body.csum, body.headers, body.args))
        return exitc::bad_args;
    return emit(o, body);
}

static int run_cmd(const Options &o, const std::vector<std::string> &args)
{
    const std::string &cmd = args[0];

    // commands taking one hex frame
    using FrameCmd = std::function<int(const Options &, wire::Buffer)>;
    std::unordered_map<std::string, FrameCmd> frame_cmds = {
        {"req", [](const Options &op, wire::Buffer b) { return cmd_req(op, b); }},
        {"res", [](const Options &op, wire::Buffer b) { return cmd_res(op, b); }},
        {"lazy-req", cmd_lazy_req},
        {"lazy-res", cmd_lazy_res},
        {"terminal", cmd_terminal},
    };

    auto it = frame_cmds.find(cmd);
    if (it != frame_cmds.end())
    {
        if (args.size() != 2)
        {
            print_usage();
            return exitc::bad_args;
        }
        wire::Buffer buf;
        if (!from_hex(args[1], buf))
        {
            std::fprintf(stderr, "error: not a hex string\n");
            return exitc::bad_args;
        }
        LOG_DEBUG("Running command: %s (%zu bytes)", cmd.c_str(), buf.size());
        return it->second(o, std::move(buf));
    }
    if (cmd == "encode-req")
        return cmd_encode_req(o, args);
    if (cmd == "encode-res")
        return cmd_encode_res(o, args);

    std::fprintf(stderr, "Unknown command: %s\n", cmd.c_str());
    print_usage();
    return exitc::bad_args;
}
}  // namespace

int main(int argc, char **argv)
{
    constants::init_log_from_env();

    if (argc < 2)
    {
        print_usage();
        return exitc::bad_args;
    }

    Options o;
    o.max_frame = constants::max_frame_size();

    std::vector<std::string> args;
    args.reserve(argc - 1);

    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--help" || a == "-h")
        {
            print_usage();
            return exitc::ok;
        }
        if (args.empty() && a == "--overhead" && i + 1 < argc)
        {
            if (!parse_size(argv[++i], o.overhead))
            {
                std::fprintf(stderr, "error: invalid --overhead\n");
                return exitc::bad_args;
            }
        }
        else if (args.empty() && a == "--max-frame" && i + 1 < argc)
        {
            if (!parse_size(argv[++i], o.max_frame) || o.max_frame > constants::MAX_FRAME_SIZE)
            {
                std::fprintf(stderr, "error: invalid --max-frame\n");
                return exitc::bad_args;
            }
        }
        else
        {
            args.push_back(std::move(a));
        }
    }
    if (args.empty())
    {
        print_usage();
        return exitc::bad_args;
    }
    if (o.overhead >= o.max_frame)
    {
        std::fprintf(stderr, "error: --overhead %zu leaves no room in a %zu byte frame\n",
                     o.overhead, o.max_frame);
        return exitc::bad_args;
    }

    return run_cmd(o, args);
}

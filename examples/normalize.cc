#include <iostream>
#include <iterator>
#include <boost/program_options.hpp>
#include <boost/program_options/parsers.hpp>

#include "jsenum/jserial.hh"
#include "jsenum/logging.hh"
#include "access_records.hh"

using namespace jsenum;
using namespace std;

namespace po = boost::program_options;

// reads a JSON array of access records from stdin and writes it back in
// canonical form

struct options {
    po::options_description generic;
    po::options_description configuration;
    po::options_description cmdline_options;

    options() :
        generic("Generic options"),
        configuration("Configuration")
    {
        generic.add_options()
            ("help", "Show help message")
            ;
    }

    void setup() {
        cmdline_options.add(generic).add(configuration);
    }
};

static void showhelp(options &opts, ostream &os = cerr) {
    os << opts.cmdline_options << endl;
}

static void parse_args(options &opts, int argc, char *argv[]) {
    po::variables_map vm;
    try {
        opts.setup();

        po::store(po::command_line_parser(argc, argv)
            .options(opts.cmdline_options).run(), vm);
        po::notify(vm);

        if (vm.count("help")) {
            showhelp(opts);
            exit(1);
        }

    } catch (exception &e) {
        cerr << "Error: " << e.what() << endl << endl;
        showhelp(opts);
        exit(1);
    }
}

struct config {
    unsigned int indent;
    bool sort_keys;
    bool required;
};

static config conf;

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);
    options opts;

    opts.configuration.add_options()
        ("indent,n", po::value<unsigned int>(&conf.indent)->default_value(0),
         "pretty print with newlines and n spaces")
        ("sort-keys", po::value<bool>(&conf.sort_keys)->zero_tokens()->default_value(false),
         "sort JSON object keys")
        ("required", po::value<bool>(&conf.required)->zero_tokens()->default_value(false),
         "every access field must name a member")
    ;
    parse_args(opts, argc, argv);

    serial_context ctx;
    unsigned flags = JSON_ENCODE_ANY | JSON_PRESERVE_ORDER | JSON_INDENT(conf.indent);
    if (conf.indent == 0)
        flags |= JSON_COMPACT;
    if (conf.sort_keys)
        flags |= JSON_SORT_KEYS;
    ctx.set_dump_flags(flags);

    try {
        cin >> noskipws;
        istream_iterator<char> it(cin);
        istream_iterator<char> end;
        string input(it, end);
        json in = json::load(input);
        json out = conf.required
            ? normalize<access_type>(ctx, in)
            : normalize<boost::optional<access_type>>(ctx, in);
        cout << out.dump(ctx.dump_flags()) << endl;
    } catch (codec_error &e) {
        LOG(ERROR) << e.what();
        return 2;
    } catch (exception &e) {
        LOG(ERROR) << e.what();
        return 1;
    }
    return 0;
}

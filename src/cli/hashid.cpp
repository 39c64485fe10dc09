// hashid: print MD5 hash ids of strings and files, or validate an id.
#include "../hash_id.h"
#include "../errors.h"
#include "../config.h"
#include "../log.h"

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#ifndef _WIN32
#include <unistd.h>
#endif

using namespace hid;

static void usage(){
    std::cout <<
    "Usage:\n"
    "  hashid [options] string <text>...   MD5 id of each text argument\n"
    "  hashid [options] file <path>...     MD5 id of each file ('-' = stdin)\n"
    "  hashid [options] check <hex>...     validate and normalize 32 digit ids\n\n"
    "Options:\n"
    "  --lower               print lowercase hex (default)\n"
    "  --upper               print uppercase hex\n"
    "  --chunk=N             stream read size in bytes (default: 8192)\n"
    "  --conf=PATH           key=value config file\n"
    "  --verbose             debug logging on stderr\n"
    "  -h, --help            show this help\n\n"
    "Exit status: 0 ok, 1 invalid input or I/O failure, 2 usage error\n";
}

static int run_string(const std::vector<std::string>& args, const Config& cfg){
    for(const auto& a : args){
        std::cout << HashId::md5_of_string(a, cfg.lowercase) << "\n";
    }
    return 0;
}

static int run_file(const std::vector<std::string>& args, const Config& cfg){
    int rc = 0;
    for(const auto& a : args){
        try {
            if(a == "-"){
                FileSource in(STDIN_FILENO, false, "stdin");
                std::cout << HashId::md5_of_stream(in, cfg.lowercase, true, cfg.read_chunk)
                          << "  -\n";
            } else {
                std::cout << HashId::md5_of_file(a, cfg.lowercase, cfg.read_chunk)
                          << "  " << a << "\n";
            }
        } catch(const HashIdError& e){
            std::fprintf(stderr, "hashid: %s: %s\n", error_kind_name(e.kind()), e.what());
            rc = 1;
        }
    }
    return rc;
}

static int run_check(const std::vector<std::string>& args, const Config& cfg){
    int rc = 0;
    for(const auto& a : args){
        std::string err;
        auto id = HashId::parse_hex(a, &err);
        if(!id){
            std::fprintf(stderr, "hashid: '%s': %s\n", a.c_str(), err.c_str());
            rc = 1;
            continue;
        }
        std::cout << id->str(cfg.lowercase) << "\n";
    }
    return rc;
}

int main(int argc, char** argv){
    Config cfg;
    std::string conf_path;
    bool verbose = false;
    int  case_override = -1;   // -1 keep config, 0 upper, 1 lower
    size_t chunk_override = 0;
    std::vector<std::string> pos;

    for(int i=1;i<argc;i++){
        std::string a(argv[i]);
        if(a=="--help"||a=="-h"){ usage(); return 0; }
        else if(a=="--lower") case_override = 1;
        else if(a=="--upper") case_override = 0;
        else if(a=="--verbose"||a=="-v") verbose = true;
        else if(a.rfind("--conf=",0)==0) conf_path = a.substr(7);
        else if(a.rfind("--chunk=",0)==0){
            char* end = nullptr;
            unsigned long long v = std::strtoull(a.c_str()+8, &end, 10);
            if(!end || *end || v==0 || v > 1024*1024){
                std::fprintf(stderr,"Bad --chunk=N (1..1048576)\n"); return 2;
            }
            chunk_override = (size_t)v;
        }
        else if(a=="--"){
            for(++i;i<argc;i++) pos.emplace_back(argv[i]);
        }
        else if(a.size()>1 && a[0]=='-' && a!="-"){
            std::fprintf(stderr,"Unknown arg: %s\n", argv[i]); return 2;
        }
        else pos.push_back(a);
    }

    if(!conf_path.empty() && !load_config(conf_path, cfg)){
        std::fprintf(stderr,"Cannot read config: %s\n", conf_path.c_str());
        return 2;
    }
    if(case_override >= 0) cfg.lowercase = (case_override == 1);
    if(chunk_override) cfg.read_chunk = chunk_override;
    if(verbose) cfg.log_level = LogLevel::DEBUG;
    apply_log_config(cfg);

    if(pos.size() < 2){ usage(); return 2; }
    const std::string cmd = pos[0];
    std::vector<std::string> args(pos.begin()+1, pos.end());

    HASHID_LOG_DEBUG(LogCategory::CLI, "command=" + cmd + " args=" + std::to_string(args.size()) +
                     " chunk=" + std::to_string(cfg.read_chunk));

    int rc;
    if(cmd=="string") rc = run_string(args, cfg);
    else if(cmd=="file") rc = run_file(args, cfg);
    else if(cmd=="check") rc = run_check(args, cfg);
    else {
        std::fprintf(stderr,"Unknown command: %s\n", cmd.c_str());
        usage();
        return 2;
    }
    std::cout.flush();
    log_flush();
    return rc;
}

#include <cstdlib>
#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include "synmacro/builtin_macros.hpp"
#include "synmacro/config.hpp"
#include "synmacro/diagnostics_json.hpp"
#include "synmacro/transform.hpp"

using namespace synmacro;

static bool read_file(const std::string& path, std::string& out){ std::ifstream ifs(path); if(!ifs) return false; std::stringstream ss; ss<<ifs.rdbuf(); out = ss.str(); return true; }

static void usage(){
    std::cerr << "usage: synmacro_driver [-D key[=value]]... [--max-depth N] [--jobs N] [--json] [--quiet] <file>...\n";
}

static int positive_arg(const std::string& flag, const char* v){
    char* end = nullptr; long n = std::strtol(v, &end, 10);
    if(*end=='\0' && n>0) return static_cast<int>(n);
    throw std::invalid_argument(flag + " expects a positive integer, got '" + v + "'");
}

int main(int argc, char** argv){
    engine_options opts;
    config_store cfg;
    bool quiet = false;
    std::vector<std::string> files;
    try{
        opts = detect_options();
        cfg = config_store::from_environment();
        for(int i=1;i<argc;++i){
            std::string a = argv[i];
            auto value = [&]() -> const char* { if(i+1>=argc) throw std::invalid_argument(a + " expects a value"); return argv[++i]; };
            if(a=="-D") cfg.add_define(value());
            else if(a.rfind("-D",0)==0) cfg.add_define(a.substr(2));
            else if(a=="--max-depth") opts.max_depth = positive_arg(a, value());
            else if(a=="--jobs" || a=="-j") opts.jobs = positive_arg(a, value());
            else if(a=="--json") opts.diag_json = true;
            else if(a=="--trace") opts.trace = true;
            else if(a=="--quiet" || a=="-q") quiet = true;
            else if(a=="--help" || a=="-h"){ usage(); return 0; }
            else if(!a.empty() && a[0]=='-'){ std::cerr << "unknown option " << a << "\n"; usage(); return 1; }
            else files.push_back(a);
        }
    }catch(const std::invalid_argument& e){ std::cerr << "error: " << e.what() << "\n"; return 1; }
    if(files.empty()){ usage(); return 1; }

    std::vector<source_unit> sources;
    for(auto& f : files){
        source_unit u; u.name = f;
        if(!read_file(f, u.text)){ std::cerr << f << ": cannot read file\n"; return 1; }
        sources.push_back(std::move(u));
    }

    macro_registry registry;
    try{
        register_builtin_macros(registry);
    }catch(const duplicate_signature_error& e){
        std::cerr << "error[" << e.code() << "]: " << e.what() << "\n"; return 1;
    }
    registry.freeze();

    auto result = expand_sources(sources, registry, cfg, opts, &std::cerr);
    if(!quiet){
        for(auto& u : result.units){
            if(!u.success) continue;
            if(sources.size()>1) std::cout << "// " << u.name << "\n";
            std::cout << to_string(u.ast) << "\n";
        }
    }
    maybe_print_json(result.success, result.diagnostics, opts.diag_json);
    return result.exit_code();
}

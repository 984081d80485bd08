#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include "equiv/assert.hpp"
#include "equiv/env.hpp"
#include "equiv/reader.hpp"
#include "equiv/report_json.hpp"

using namespace equiv;

static bool read_file(const std::string& path, std::string& out){
    std::ifstream ifs(path);
    if(!ifs) return false;
    std::stringstream ss; ss<<ifs.rdbuf(); out = ss.str();
    return true;
}

static int usage(){
    std::cerr << "usage: equiv_diff [--strict|--permissive] [--json] [--message TEXT] <actual> <expected>\n";
    return 2;
}

int main(int argc, char** argv){
    CompareEnv env = detect_env();
    CompareOptions opts = options_from_env(env);
    bool json = env.reportJson;
    std::string message;
    std::string files[2];
    int nfiles = 0;
    for(int i=1;i<argc; ++i){
        std::string a = argv[i];
        if(a=="--strict") opts.policy = TypePolicy::Strict;
        else if(a=="--permissive") opts.policy = TypePolicy::Permissive;
        else if(a=="--json") json = true;
        else if(a=="--message"){ if(i+1>=argc) return usage(); message = argv[++i]; }
        else if(!a.empty() && a[0]=='-') { std::cerr << "equiv_diff: unknown option " << a << "\n"; return usage(); }
        else if(nfiles<2) files[nfiles++] = a;
        else return usage();
    }
    if(nfiles!=2) return usage();

    node_ptr sides[2];
    for(int k=0;k<2; ++k){
        std::string src;
        if(!read_file(files[k], src)){ std::cerr << "equiv_diff: cannot read " << files[k] << "\n"; return 2; }
        try { sides[k] = parse(src, files[k]); }
        catch(const parse_error& e){ std::cerr << "equiv_diff: " << e.what() << "\n"; return 2; }
    }

    auto res = check_equivalent(sides[0], sides[1], opts);
    if(res.success){ std::cout << "equivalent\n"; return 0; }
    auto msg = [&]{ return message; };
    MismatchReport report = make_report(*res.mismatch, msg, "equiv_diff");
    if(json) std::cerr << report_to_json(report) << "\n";
    else std::cerr << format_report(report, env.maxValueWidth);
    return 1;
}

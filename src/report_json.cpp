#include "equiv/report_json.hpp"
#include "equiv/env.hpp"
#include <sstream>
#include <cstdio>

namespace equiv {

std::string json_escape(const std::string& s){
    static const char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size() + 2);
    out += '"';
    for(unsigned char c : s){
        switch(c){
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if(c < 0x20){ out += "\\u00"; out += hex[c >> 4]; out += hex[c & 0xF]; }
                else out += static_cast<char>(c);
                break;
        }
    }
    out += '"';
    return out;
}

static void append_path_json(std::ostringstream& os, const ComparisonPath& path){
    os<<"[";
    for(size_t i=0;i<path.size(); ++i){
        if(i) os<<",";
        os<<json_escape(path[i]);
    }
    os<<"]";
}

static std::string value_json(const node_ptr& v){
    if(is_null(v)) return "null";
    return json_escape(to_string(v));
}

std::string report_to_json(const MismatchReport& r){
    std::ostringstream os;
    os<<"{"
        "\"code\":"<<json_escape(mismatch_code(r.kind))
        <<",\"kind\":"<<json_escape(mismatch_name(r.kind))
        <<",\"caller\":"<<json_escape(r.caller)
        <<",\"path\":"<<json_escape(render_path(r.path))
        <<",\"segments\":";
    append_path_json(os, r.path);
    os<<",\"expected\":"<<value_json(r.expected)
      <<",\"actual\":"<<value_json(r.actual);
    if(r.kind == MismatchKind::TypeMismatch){
        os<<",\"expected_type\":"<<json_escape(r.expected_type)
          <<",\"actual_type\":"<<json_escape(r.actual_type);
    }
    os<<",\"message\":"<<json_escape(r.custom_message)<<"}";
    return os.str();
}

void maybe_print_json(const MismatchReport& r, bool enabled){
    if(!enabled) return;
    auto js=report_to_json(r);
    std::fprintf(stderr, "%s\n", js.c_str());
}

void maybe_print_json(const MismatchReport& r){
    maybe_print_json(r, detect_env().reportJson);
}

} // namespace equiv

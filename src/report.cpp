#include "equiv/report.hpp"
#include <sstream>

namespace equiv {

std::string render_value(const node_ptr& v, size_t max_width){
    std::string s = is_null(v) ? std::string("null") : to_string(v);
    if(max_width && s.size() > max_width){
        s.resize(max_width);
        s += "...";
    }
    return s;
}

std::string format_report(const MismatchReport& r, size_t max_width){
    std::ostringstream os;
    os << r.caller << " [" << mismatch_code(r.kind) << " " << mismatch_name(r.kind) << "]\n";
    os << "    comparing object equivalence, at path:\n";
    os << (r.path.empty() ? std::string("<root>") : render_path(r.path)) << "\n\n";
    switch(r.kind){
        case MismatchKind::TypeMismatch:
            os << "    expected type to be\n" << r.expected_type << "\n";
            os << "    but was\n" << r.actual_type << "\n";
            break;
        case MismatchKind::MissingMember:
            os << "    expected member with value\n" << render_value(r.expected, max_width) << "\n";
            os << "    but the actual object has no such member\n";
            break;
        default:
            os << "    expected value to be\n" << render_value(r.expected, max_width) << "\n";
            os << "    but was\n" << render_value(r.actual, max_width) << "\n";
            break;
    }
    if(!r.custom_message.empty()){
        os << "\nAdditional info:\n    " << r.custom_message << "\n";
    }
    return os.str();
}

} // namespace equiv

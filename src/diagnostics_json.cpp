#include "synmacro/diagnostics_json.hpp"
#include "synmacro/config.hpp"
#include <sstream>
#include <cstdio>

namespace synmacro {

std::string json_escape(const std::string& s){
    std::ostringstream o; o<<'"';
    for(char c: s){
        switch(c){
            case '"': o<<"\\\""; break; case '\\': o<<"\\\\"; break;
            case '\n': o<<"\\n"; break; case '\r': o<<"\\r"; break; case '\t': o<<"\\t"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20){ char buf[7]; std::snprintf(buf,sizeof(buf),"\\u%04X", (unsigned char)c); o<<buf; }
                else { o<<c; }
                break;
        }
    }
    o<<'"';
    return o.str();
}

static void append_position(std::ostringstream& os, const std::optional<source_span>& where){
    if(where && where->known()){
        os<<"\"file\":"<<json_escape(where->file)<<",\"line\":"<<where->start_line<<",\"col\":"<<where->start_col;
    } else {
        os<<"\"file\":null,\"line\":0,\"col\":0";
    }
}

static void append_notes_json(std::ostringstream& os, const std::vector<diagnostic_note>& notes){
    os<<"[";
    for(size_t i=0;i<notes.size(); ++i){
        if(i) os<<",";
        os<<"{\"message\":"<<json_escape(notes[i].message)<<",";
        append_position(os, notes[i].where);
        os<<"}";
    }
    os<<"]";
}

static void append_diag_json(std::ostringstream& os, const diagnostic& d){
    os<<"{"
        "\"code\":"<<json_escape(d.code)
        <<",\"macro\":"<<json_escape(d.macro)
        <<",\"message\":"<<json_escape(d.message)
        <<",\"unit\":"<<json_escape(d.unit)<<",";
    append_position(os, d.where);
    os<<",\"notes\":";
    append_notes_json(os, d.notes);
    os<<"}";
}

std::string diagnostics_to_json(bool success, const std::vector<diagnostic>& diags){
    std::ostringstream os;
    os<<"{\"success\":"<<(success?"true":"false")<<",\"errors\":[";
    bool first = true;
    for(const auto& d : diags){
        if(d.severity != "error") continue;
        if(!first) os<<",";
        first = false; append_diag_json(os, d);
    }
    os<<"],\"warnings\":[";
    first = true;
    for(const auto& d : diags){
        if(d.severity == "error") continue;
        if(!first) os<<",";
        first = false; append_diag_json(os, d);
    }
    os<<"]}";
    return os.str();
}

void maybe_print_json(bool success, const std::vector<diagnostic>& diags, bool force){
    if(force || env_flag_enabled("SYNMACRO_DIAG_JSON")){
        auto js=diagnostics_to_json(success, diags);
        std::fprintf(stderr, "%s\n", js.c_str());
    }
}

} // namespace synmacro

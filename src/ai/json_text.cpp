#include <ai-autobuilder/ai/json_text.hpp>
#include <cctype>
#include <cstdio>

namespace autobuilder::ai {

std::string escape_json(const std::string& in){
    std::string out; out.reserve(in.size()+16);
    for(char c: in){
        switch(c){
            case '"': out+="\\\""; break;
            case '\\': out+="\\\\"; break;
            case '\n': out+="\\n"; break;
            case '\r': out+="\\r"; break;
            case '\t': out+="\\t"; break;
            default:
                if((unsigned char)c < 0x20){ char buf[8]; std::snprintf(buf,sizeof(buf),"\\u%04x",(unsigned char)c); out+=buf; }
                else out.push_back(c);
        }
    }
    return out;
}

static void append_utf8(std::string& out, unsigned cp){
    if(cp<0x80) out.push_back((char)cp);
    else if(cp<0x800){ out.push_back((char)(0xC0|(cp>>6))); out.push_back((char)(0x80|(cp&0x3F))); }
    else if(cp<0x10000){ out.push_back((char)(0xE0|(cp>>12))); out.push_back((char)(0x80|((cp>>6)&0x3F))); out.push_back((char)(0x80|(cp&0x3F))); }
    else { out.push_back((char)(0xF0|(cp>>18))); out.push_back((char)(0x80|((cp>>12)&0x3F))); out.push_back((char)(0x80|((cp>>6)&0x3F))); out.push_back((char)(0x80|(cp&0x3F))); }
}

static bool parse_hex4(const std::string& s, size_t at, unsigned& cp){
    if(at+4>s.size()) return false;
    cp=0;
    for(size_t k=at;k<at+4;++k){
        char h=s[k]; cp<<=4;
        if(h>='0'&&h<='9') cp|=h-'0'; else if(h>='a'&&h<='f') cp|=h-'a'+10; else if(h>='A'&&h<='F') cp|=h-'A'+10; else return false;
    }
    return true;
}

std::string extract_string_field(const std::string& body, const std::string& key, bool& found){
    found=false;
    size_t pos=body.find("\""+key+"\""); if(pos==std::string::npos) return {};
    pos=body.find(':',pos); if(pos==std::string::npos) return {};
    ++pos; while(pos<body.size() && std::isspace((unsigned char)body[pos])) ++pos;
    if(pos>=body.size() || body[pos]!='"') return {};
    std::string text;
    for(size_t i=pos+1;i<body.size();++i){
        char c=body[i];
        if(c=='"'){ found=true; return text; }
        if(c!='\\'){ text.push_back(c); continue; }
        if(++i>=body.size()) break;
        switch(body[i]){
            case 'n': text+='\n'; break;
            case 'r': text+='\r'; break;
            case 't': text+='\t'; break;
            case 'b': text+='\b'; break;
            case 'f': text+='\f'; break;
            case 'u': {
                unsigned cp=0;
                if(!parse_hex4(body,i+1,cp)) return text;
                i+=4;
                // surrogate pair
                unsigned lo=0;
                if(cp>=0xD800 && cp<0xDC00 && i+2<body.size() && body[i+1]=='\\' && body[i+2]=='u' && parse_hex4(body,i+3,lo) && lo>=0xDC00 && lo<0xE000){
                    cp=0x10000+((cp-0xD800)<<10)+(lo-0xDC00); i+=6;
                }
                append_utf8(text,cp); break;
            }
            default: text.push_back(body[i]);
        }
    }
    return text;
}

int extract_int_field(const std::string& body, const std::string& key){
    size_t p=body.find("\""+key+"\""); if(p==std::string::npos) return -1;
    p=body.find(':',p); if(p==std::string::npos) return -1;
    ++p; while(p<body.size() && body[p]==' ') ++p;
    size_t e=p; while(e<body.size() && std::isdigit((unsigned char)body[e])) ++e;
    if(e==p || e-p>9) return -1;
    return std::stoi(body.substr(p,e-p));
}

} // namespace autobuilder::ai

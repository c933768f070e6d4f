#include "CodeAssist.h"

namespace {

void help(){
    std::cout <<
R"(Commands:
  <source line>   append to the buffer
  (blank line)    run the buffer
  :run            run the buffer
  :clear          discard the buffer
  :show           print the buffer
  :help           show this help
  :quit           exit
Each run is a fresh execution; nothing carries over between runs.
)";
}

// Prints the relayed text on stdout, newline-terminated.
void print_result(const Sandbox::ExecutionResult& r){
    std::cout << r.text;
    if(r.text.empty() || r.text.back() != '\n') std::cout << '\n';
    std::cout.flush();
}

int run_source(const std::string& source, const Sandbox::SandboxOptions& opts){
    auto r = Sandbox::execute(source, opts);
    print_result(r);
    return r.ok() ? 0 : 1;
}

int interactive(const Sandbox::SandboxOptions& opts, bool quiet){
    InputHistory history;

    if(!quiet){
        std::cout << "codeassist sandbox. Blank line runs the buffer, :help lists commands.\n";
    }

    std::vector<std::string> buffer;
    auto join_buffer = [&]{
        std::string src;
        for(const auto& l : buffer){ src += l; src += '\n'; }
        return src;
    };
    auto run_buffer = [&]{
        if(buffer.empty()) return;
        run_source(join_buffer(), opts);
        buffer.clear();
    };

    std::string line;
    while(read_line_with_history(buffer.empty() ? ">>> " : "... ", line, history)){
        std::string cmd = trim_copy(line);
        history.record(line);

        if(cmd.empty() || cmd == ":run"){ run_buffer(); continue; }
        if(cmd == ":quit" || cmd == ":q") break;
        if(cmd == ":clear"){ buffer.clear(); continue; }
        if(cmd == ":show"){
            std::cout << join_buffer();
            std::cout.flush();
            continue;
        }
        if(cmd == ":help"){ help(); continue; }
        if(cmd[0] == ':' && cmd.find(' ') == std::string::npos){
            std::cerr << "unknown command " << cmd << " (try :help)\n";
            continue;
        }
        buffer.push_back(line);
    }
    run_buffer();

    if(!history.flush()){
        std::cerr << "codeassist: cannot write history to " << history.file()->string() << "\n";
    }
    return 0;
}

} // namespace

int main(int argc, char** argv){
    TRACE_FN();
    std::ios::sync_with_stdio(false);

    const std::string usage_text = std::string("usage: ") + argv[0] +
        " [--max-call-depth N] [--max-steps N] [--quiet] [script|-]";
    auto usage = [&](const std::string& msg){
        std::cerr << msg << "\n" << usage_text << "\n";
        return 2;
    };

    Sandbox::SandboxOptions opts = Sandbox::SandboxOptions::from_env();
    std::string script_path;
    bool have_script = false;
    bool quiet_mode = false;

    for(int i = 1; i < argc; ++i){
        std::string arg = argv[i];
        if(arg == "--help" || arg == "-h"){
            std::cout << usage_text << "\n";
            return 0;
        }
        if(arg == "--quiet" || arg == "-q"){
            quiet_mode = true;
            continue;
        }
        if(arg == "--max-call-depth" || arg == "--max-steps" || arg == "--max-nesting"){
            if(i + 1 >= argc) return usage(arg + " requires a value");
            try{
                Sandbox::apply_option(opts, arg.substr(2), argv[++i]);
            } catch(const std::exception& e){
                return usage(e.what());
            }
            continue;
        }
        if(arg.size() > 1 && arg[0] == '-'){
            return usage("unknown option " + arg);
        }
        if(have_script) return usage("only one script may be given");
        script_path = arg;
        have_script = true;
    }

    if(!have_script) return interactive(opts, quiet_mode);

    std::string source;
    if(script_path == "-"){
        std::ostringstream ss;
        ss << std::cin.rdbuf();
        source = ss.str();
    } else {
        try{
            source = read_text_file(script_path);
        } catch(const std::exception& e){
            std::cerr << "codeassist: " << e.what() << "\n";
            return 2;
        }
    }
    return run_source(source, opts);
}

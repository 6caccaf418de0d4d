#include "harness_script.h"
#include "sandbox_internal.h"

#include <set>
#include <sstream>

namespace code_sandbox
{

    namespace {

        // 受信任的 harness 主体。用户代码只在 namespace 字典里运行，
        // 看不到这里的 sys/builtins 引用。
        const char* kHarnessBody = R"PY(

def _report(kind, name, message):
    with open(_REPORT_FD, 'w', encoding='utf-8', errors='replace', closefd=True) as stream:
        stream.write(kind + '\n' + name + '\n' + message)


def _flush():
    try:
        sys.stdout.flush()
    except OSError:
        pass


def _main():
    with open(sys.argv[1], encoding='utf-8', errors='replace') as source_file:
        source = source_file.read()

    import builtins

    modules = {}
    for name in _ALLOWED_MODULES:
        try:
            modules[name] = __import__(name)
        except ImportError as exc:
            _report('setup', type(exc).__name__, str(exc))
            return 2

    exposed = {}
    for name in _ALLOWED_BUILTINS:
        if hasattr(builtins, name):
            exposed[name] = getattr(builtins, name)

    def guarded_import(name, globals=None, locals=None, fromlist=(), level=0):
        if level == 0 and name in modules:
            return modules[name]
        raise ImportError("import of '%s' is not allowed in this lesson" % name)

    exposed['__import__'] = guarded_import
    namespace = {'__builtins__': exposed, '__name__': '__main__'}
    namespace.update(modules)

    try:
        code = compile(source, '<submission>', 'exec')
    except SyntaxError as exc:
        _report('fault', type(exc).__name__, '%s (line %s)' % (exc.msg, exc.lineno))
        return 1

    try:
        exec(code, namespace)
    except EOFError as exc:
        _flush()
        _report('eof', type(exc).__name__, str(exc))
        return 3
    except BaseException as exc:
        _flush()
        _report('fault', type(exc).__name__, str(exc))
        return 1

    _flush()
    return 0


sys.exit(_main())
)PY";

        void WriteTuple(std::ostringstream& out, const char* var, const std::set<std::string>& names)
        {
            out << var << " = (";
            for (const auto& name : names) {
                if (!IsValidName(name)) continue;
                out << "'" << name << "', ";
            }
            out << ")\n";
        }

    } // anonymous namespace

    std::string BuildHarnessScript(const AllowListPolicy& policy)
    {
        std::ostringstream script;
        script << "import sys\n\n";
        script << "_REPORT_FD = " << REPORT_FD << "\n";
        WriteTuple(script, "_ALLOWED_MODULES", policy.allowed_modules);
        WriteTuple(script, "_ALLOWED_BUILTINS", policy.allowed_builtins);
        script << kHarnessBody;
        return script.str();
    }

    FaultReport ParseFaultReport(const std::string& raw)
    {
        FaultReport report;
        if (raw.empty()) return report;

        std::size_t first = raw.find('\n');
        if (first == std::string::npos) {
            report.kind = raw;
            return report;
        }
        report.kind = raw.substr(0, first);

        std::size_t second = raw.find('\n', first + 1);
        if (second == std::string::npos) {
            report.type = raw.substr(first + 1);
            return report;
        }
        report.type = raw.substr(first + 1, second - first - 1);
        report.message = raw.substr(second + 1);
        return report;
    }

} // namespace code_sandbox

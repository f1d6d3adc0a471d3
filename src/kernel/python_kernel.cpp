#include <execd/kernel/python_kernel.hpp>

namespace execd {

namespace {

const char* kPythonDriver = R"PY(
import ast, json, os, sys, traceback

_ctl = os.fdopen(3, 'w', buffering=1)
_req = os.fdopen(4, 'r')
_ns = {'__name__': '__main__', '__builtins__': __builtins__}

def _send(frame):
    _ctl.write(json.dumps(frame) + '\n')
    _ctl.flush()

def _flush():
    for stream in (sys.stdout, sys.stderr):
        try:
            stream.flush()
        except Exception:
            pass

def _run(code):
    tree = ast.parse(code, '<cell>', 'exec')
    tail = None
    if tree.body and isinstance(tree.body[-1], ast.Expr):
        tail = ast.Expression(tree.body.pop().value)
    exec(compile(tree, '<cell>', 'exec'), _ns)
    if tail is not None:
        return eval(compile(tail, '<cell>', 'eval'), _ns)
    return None

def _error(exc):
    tb = exc.__traceback__
    while tb is not None and tb.tb_frame.f_code.co_filename == '<string>':
        tb = tb.tb_next
    return {'type': 'done', 'status': 'error', 'ename': type(exc).__name__,
            'evalue': str(exc),
            'traceback': traceback.format_exception(type(exc), exc, tb)}

_send({'type': 'ready', 'language': 'python', 'version': sys.version.split()[0]})

while True:
    try:
        line = _req.readline()
    except KeyboardInterrupt:
        continue
    if not line:
        break
    try:
        msg = json.loads(line)
    except ValueError:
        continue
    if msg.get('type') == 'shutdown':
        break
    try:
        value = _run(msg.get('code', ''))
        reply = {'type': 'done', 'status': 'ok'}
        if value is not None:
            reply['result'] = {'text/plain': repr(value)}
    except BaseException as exc:
        reply = _error(exc)
    while True:
        try:
            _flush()
            _send(reply)
            break
        except KeyboardInterrupt:
            continue
)PY";

} // anonymous namespace

PythonKernel::PythonKernel(const std::string& binary)
    : binary_(binary.empty() ? std::string("python3") : binary)
{
}

std::vector<std::string> PythonKernel::command_line() const {
    std::vector<std::string> argv;
    argv.push_back(binary_);
    argv.push_back("-u");
    argv.push_back("-c");
    argv.push_back(kPythonDriver);
    return argv;
}

std::map<std::string, std::string> PythonKernel::driver_env() const {
    std::map<std::string, std::string> env;
    env["PYTHONUNBUFFERED"] = "1";
    env["PYTHONIOENCODING"] = "utf-8";
    return env;
}

} // namespace execd

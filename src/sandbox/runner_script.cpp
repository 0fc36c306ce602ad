#include "sandbox/runner_script.hpp"

#include "artifacts/marker_protocol.hpp"

namespace anabox::sandbox {
namespace {

const char* kRunnerTemplate = R"PY(import base64
import builtins
import io
import mimetypes
import os
import sys

_MARKER = "@MARKER_TAG@"
_ALLOWED = frozenset(m for m in os.environ.get("ANABOX_ALLOWED_IMPORTS", "").split(",") if m)
_INLINE_MAX = int(os.environ.get("ANABOX_INLINE_MAX", "262144"))
_ARTIFACT_DIR = os.environ.get("ANABOX_ARTIFACT_DIR") or os.getcwd()
CONTEXT_PATH = os.environ.get("ANABOX_CONTEXT", "")

_USER_NS = {"__name__": "__main__", "__builtins__": builtins}
_real_import = builtins.__import__
_stdout = sys.stdout
_seq = [0]
_files = [0]


def _emit(kind, mime, payload):
    sys.stdout.flush()
    _seq[0] += 1
    n = _seq[0]
    _stdout.write("<<%s seq=%d kind=%s mime=%s>>%s<</%s seq=%d>>\n" % (_MARKER, n, kind, mime, payload, _MARKER, n))
    _stdout.flush()


def _extension(mime):
    guessed = mimetypes.guess_extension(mime) or ".bin"
    return ".jpg" if guessed == ".jpe" else guessed


def emit_image(data, mime="image/png"):
    data = bytes(data)
    if len(data) <= _INLINE_MAX:
        _emit("image_inline", mime, base64.b64encode(data).decode("ascii"))
        return
    _files[0] += 1
    name = "artifact-%d%s" % (_files[0], _extension(mime))
    with open(os.path.join(_ARTIFACT_DIR, name), "wb") as handle:
        handle.write(data)
    _emit("image_ref", mime, name)


def emit_image_file(path, mime=None):
    if mime is None:
        mime = mimetypes.guess_type(path)[0] or "application/octet-stream"
    if os.path.getsize(path) <= _INLINE_MAX:
        with open(path, "rb") as handle:
            emit_image(handle.read(), mime)
        return
    _emit("image_ref", mime, os.path.abspath(path))


def _flush_figures():
    plt = sys.modules.get("matplotlib.pyplot")
    if plt is None:
        return
    for number in plt.get_fignums():
        figure = plt.figure(number)
        buffer = io.BytesIO()
        figure.savefig(buffer, format="png", bbox_inches="tight")
        emit_image(buffer.getvalue(), "image/png")
    plt.close("all")


def _show(*args, **kwargs):
    _flush_figures()


def _patch_pyplot():
    plt = sys.modules.get("matplotlib.pyplot")
    if plt is not None and getattr(plt, "show", None) is not _show:
        plt.show = _show


def _guarded_import(name, globals=None, locals=None, fromlist=(), level=0):
    if globals is _USER_NS:
        if level != 0:
            raise ImportError("relative imports are not allowed")
        top = name.partition(".")[0]
        if top != "__future__" and top not in _ALLOWED:
            raise ImportError("import of '%s' is not allowed" % top)
    module = _real_import(name, globals, locals, fromlist, level)
    if name.partition(".")[0] == "matplotlib":
        _patch_pyplot()
    return module


def _main():
    with open(sys.argv[1], "r", encoding="utf-8") as handle:
        source = handle.read()
    code = compile(source, "analysis.py", "exec")
    _USER_NS["emit_image"] = emit_image
    _USER_NS["emit_image_file"] = emit_image_file
    _USER_NS["CONTEXT_PATH"] = CONTEXT_PATH
    builtins.__import__ = _guarded_import
    try:
        exec(code, _USER_NS)
    finally:
        builtins.__import__ = _real_import
        sys.stdout.flush()
    _flush_figures()
    sys.stdout.flush()


if __name__ == "__main__":
    _main()
)PY";

}  // namespace

const std::string& RunnerScript() {
    static const std::string script = [] {
        std::string text = kRunnerTemplate;
        const std::string placeholder = "@MARKER_TAG@";
        const auto pos = text.find(placeholder);
        text.replace(pos, placeholder.size(), std::string(artifacts::kMarkerTag));
        return text;
    }();
    return script;
}

}  // namespace anabox::sandbox

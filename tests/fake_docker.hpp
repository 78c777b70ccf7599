#pragma once
#include <filesystem>
#include <string>
#include "test_util.hpp"

// A docker stand-in that understands run/exec/stop/rm; stop and rm accept
// either the id or the --name given to run. exec runs the
// command on the host inside the directory that `run -v` mounted, which is
// enough to exercise the bind-mount contract. Every invocation is appended
// to state/calls.
class FakeDocker {
public:
    FakeDocker() {
        std::filesystem::create_directories(state());
        write_executable(binary(), script());
    }

    std::filesystem::path binary() const { return dir_.path() / "docker"; }
    std::filesystem::path state() const { return dir_.path() / "state"; }
    std::string calls() const { return read_file(state() / "calls"); }
    std::string forwarded_env() const { return read_file(state() / "env"); }
    std::string user() const { return read_file(state() / "user"); }
    bool running(const std::string& id) const { return std::filesystem::exists(state() / (id + ".running")); }

private:
    std::string script() const {
        return R"(#!/bin/bash
STATE=')" + state().string() + R"SH('
[ -n "$STATE" ] || exit 1
echo "$*" >> "$STATE/calls"
cmd="$1"; shift
case "$cmd" in
  run)
    mount=""; image=""; name=""
    while [ $# -gt 0 ]; do
      case "$1" in
        -d) shift ;;
        --name) name="$2"; shift 2 ;;
        --user) echo "$2" > "$STATE/user"; shift 2 ;;
        -v) mount="$2"; shift 2 ;;
        -e) echo "$2" >> "$STATE/env"; shift 2 ;;
        *) image="$1"; shift; break ;;
      esac
    done
    case "$image" in
      missing*)
        echo "Unable to find image '$image' locally" >&2
        echo "docker: Error response from daemon: pull access denied for ${image%%:*}" >&2
        exit 125 ;;
      broken*)
        echo "docker: Error response from daemon: OCI runtime create failed" >&2
        exit 125 ;;
      slow*)
        sleep 60 ;;
    esac
    n=$(( $(cat "$STATE/count" 2>/dev/null || echo 0) + 1 ))
    echo "$n" > "$STATE/count"
    id="fake$n"
    echo "${mount%%:*}" > "$STATE/$id.mount"
    touch "$STATE/$id.running"
    [ -n "$name" ] && echo "$id" > "$STATE/$name.id"
    echo "$id"
    ;;
  exec)
    while [ $# -gt 0 ]; do
      case "$1" in
        -i) shift ;;
        -w) shift 2 ;;
        *) break ;;
      esac
    done
    id="$1"; shift
    if [ ! -f "$STATE/$id.running" ]; then
      echo "Error response from daemon: container $id is not running" >&2
      exit 1
    fi
    cd "$(cat "$STATE/$id.mount")" || exit 1
    exec "$@"
    ;;
  stop)
    while [ "$1" = "-t" ]; do shift 2; done
    id="$1"
    [ -n "$id" ] && [ -f "$STATE/$id.id" ] && id="$(cat "$STATE/$id.id")"
    [ -n "$id" ] && rm -f "$STATE/$id.running"
    echo "$1"
    ;;
  rm)
    [ "$1" = "-f" ] && shift
    id="$1"
    [ -n "$id" ] && [ -f "$STATE/$id.id" ] && id="$(cat "$STATE/$id.id")"
    [ -n "$id" ] && rm -f "$STATE/$id.running" "$STATE/$id.mount"
    echo "$1"
    ;;
  *)
    echo "unknown command $cmd" >&2
    exit 1 ;;
esac
)SH";
    }

    ScopedTempDir dir_;
};

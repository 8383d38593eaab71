/**
 * @file builtin_languages.cpp
 * @brief Built-in language adapter table.
 *
 * Interpreted languages get a tight address-space cap. JIT and managed
 * runtimes (Node, JVM, Go, rustc) reserve large PROT_NONE ranges up front,
 * so their RLIMIT_AS is left open. RLIMIT_DATA still bounds what they
 * actually commit, and the runtime heap flags keep them well below it.
 */

#include "language/language_registry.hpp"

namespace sandbox_exec {

namespace {

constexpr int64_t kMiB = 1024 * 1024;

IsolationProfile interpreted_profile() {
    return IsolationProfile{
        .cpu_seconds = 30,
        .memory_bytes = 256 * kMiB,
        .file_size_bytes = 16 * kMiB,
        .max_processes = -1,
        .max_open_files = 64
    };
}

IsolationProfile shell_profile() {
    return IsolationProfile{
        .cpu_seconds = 10,
        .memory_bytes = 128 * kMiB,
        .file_size_bytes = 16 * kMiB,
        .max_processes = -1,
        .max_open_files = 64
    };
}

IsolationProfile native_toolchain_profile() {
    return IsolationProfile{
        .cpu_seconds = 60,
        .memory_bytes = 1024 * kMiB,
        .file_size_bytes = 64 * kMiB,
        .max_processes = -1,
        .max_open_files = 128
    };
}

IsolationProfile managed_runtime_profile() {
    return IsolationProfile{
        .cpu_seconds = 60,
        .memory_bytes = -1,
        .data_bytes = 1024 * kMiB,
        .file_size_bytes = 64 * kMiB,
        .max_processes = -1,
        .max_open_files = 256
    };
}

}  // namespace

std::vector<LanguageAdapter> LanguageRegistry::builtin_adapters() {
    std::vector<LanguageAdapter> adapters;

    adapters.push_back(LanguageAdapter{
        .name = "python",
        .display_name = "Python 3",
        .extension = ".py",
        .source_filename = "main.py",
        .run_command = {"python3", "-u", "{file}"},
        .runtime = "python3",
        .isolation = interpreted_profile(),
        .enabled = true,
        .example_code = "print(\"Hello, World!\")"
    });

    adapters.push_back(LanguageAdapter{
        .name = "javascript",
        .display_name = "JavaScript (Node.js)",
        .extension = ".js",
        .source_filename = "index.js",
        .run_command = {"node", "--max-old-space-size=256", "{file}"},
        .runtime = "node",
        .isolation = managed_runtime_profile(),
        .enabled = true,
        .example_code = "console.log(\"Hello, World!\");"
    });

    adapters.push_back(LanguageAdapter{
        .name = "shell",
        .display_name = "POSIX Shell",
        .extension = ".sh",
        .source_filename = "main.sh",
        .run_command = {"/bin/sh", "{file}"},
        .runtime = "/bin/sh",
        .isolation = shell_profile(),
        .enabled = true,
        .example_code = "echo \"Hello, World!\""
    });

    adapters.push_back(LanguageAdapter{
        .name = "bash",
        .display_name = "Bash",
        .extension = ".sh",
        .source_filename = "main.sh",
        .run_command = {"bash", "{file}"},
        .runtime = "bash",
        .isolation = shell_profile(),
        .enabled = true,
        .example_code = "echo \"Hello, World!\""
    });

    adapters.push_back(LanguageAdapter{
        .name = "ruby",
        .display_name = "Ruby",
        .extension = ".rb",
        .source_filename = "main.rb",
        .run_command = {"ruby", "{file}"},
        .runtime = "ruby",
        .isolation = interpreted_profile(),
        .enabled = true,
        .example_code = "puts \"Hello, World!\""
    });

    adapters.push_back(LanguageAdapter{
        .name = "c",
        .display_name = "C (gcc)",
        .extension = ".c",
        .source_filename = "main.c",
        .run_command = {"/bin/sh", "-c", "gcc -O2 -o main {file} -lm && exec ./main"},
        .runtime = "gcc",
        .isolation = native_toolchain_profile(),
        .enabled = true,
        .example_code = "#include <stdio.h>\n\nint main(void) {\n"
                        "    printf(\"Hello, World!\\n\");\n    return 0;\n}\n"
    });

    adapters.push_back(LanguageAdapter{
        .name = "cpp",
        .display_name = "C++ (g++)",
        .extension = ".cpp",
        .source_filename = "main.cpp",
        .run_command = {"/bin/sh", "-c", "g++ -O2 -std=c++17 -o main {file} && exec ./main"},
        .runtime = "g++",
        .isolation = native_toolchain_profile(),
        .enabled = true,
        .example_code = "#include <iostream>\n\nint main() {\n"
                        "    std::cout << \"Hello, World!\" << std::endl;\n    return 0;\n}\n"
    });

    adapters.push_back(LanguageAdapter{
        .name = "java",
        .display_name = "Java",
        .extension = ".java",
        .source_filename = "Main.java",
        .run_command = {"/bin/sh", "-c",
                        "javac -J-Xmx256m -J-XX:-UsePerfData {file}"
                        " && exec java -Xmx256m -XX:-UsePerfData -cp . Main"},
        .runtime = "javac",
        .isolation = managed_runtime_profile(),
        .enabled = true,
        .example_code = "public class Main {\n"
                        "    public static void main(String[] args) {\n"
                        "        System.out.println(\"Hello, World!\");\n    }\n}\n",
        .inherited_env = {"JAVA_HOME"},
        .home_env = {}
    });

    adapters.push_back(LanguageAdapter{
        .name = "go",
        .display_name = "Go",
        .extension = ".go",
        .source_filename = "main.go",
        .run_command = {"go", "run", "{file}"},
        .runtime = "go",
        .isolation = managed_runtime_profile(),
        .enabled = true,
        .example_code = "package main\n\nimport \"fmt\"\n\n"
                        "func main() {\n    fmt.Println(\"Hello, World!\")\n}\n",
        .inherited_env = {"GOROOT", "GOPROXY"},
        .home_env = {}
    });

    adapters.push_back(LanguageAdapter{
        .name = "rust",
        .display_name = "Rust",
        .extension = ".rs",
        .source_filename = "main.rs",
        .run_command = {"/bin/sh", "-c", "rustc -O -o main {file} && exec ./main"},
        .runtime = "rustc",
        .isolation = managed_runtime_profile(),
        .enabled = true,
        .example_code = "fn main() {\n    println!(\"Hello, World!\");\n}\n",
        // rustup's rustc proxy finds its toolchain through these.
        .inherited_env = {"RUSTUP_HOME", "CARGO_HOME", "RUSTUP_TOOLCHAIN"},
        .home_env = {{"RUSTUP_HOME", ".rustup"}, {"CARGO_HOME", ".cargo"}}
    });

    return adapters;
}

}  // namespace sandbox_exec

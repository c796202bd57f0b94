/**
 * sbx_run.cc — command line front-end for the dispatcher
 *
 * Demonstrates:
 *   - Extension dispatch:  sbx_run hello.py arg1 arg2
 *   - Explicit language:   sbx_run -l python script.txt
 *   - Dry run:             sbx_run --dry-run main.go
 *   - Registry listing:    sbx_run --list
 *
 * Environment: CONFIG_PATH, LOG_PATH, LOG_TO_CONSOLE, LOG_LEVEL, CONTAINER_RUNTIME
 *
 * Build: cmake --build . --target sbx_run
 * Run:   CONFIG_PATH=../config/languages.json ./sbx_run hello.py
 */

#include "../include/sbx_a_dispatcher.hh"

#include <cstring>
#include <iostream>

static void print_usage(const char* prog)
{
  std::cerr << "Usage: " << prog << " [options] <file> [args...]\n"
    << "\n"
    << "Run a source file inside a container chosen by its extension.\n"
    << "\n"
    << "Options:\n"
    << "  -l, --language NAME   Use this language profile instead of the extension\n"
    << "  -n, --dry-run         Print the container command instead of running it\n"
    << "      --list            List configured languages and their extensions\n"
    << "  -h, --help            Show this help\n";
}

int main(int argc, char** argv)
{
  std::string language;
  bool dry_run = false;
  bool list = false;
  int file_at = -1;
  for (int i = 1; i < argc; i++)
  {
    if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0)
    {
      print_usage(argv[0]);
      return 0;
    }
    else if ((strcmp(argv[i], "--language") == 0 || strcmp(argv[i], "-l") == 0) && i + 1 < argc) language = argv[++i];
    else if (strcmp(argv[i], "--dry-run") == 0 || strcmp(argv[i], "-n") == 0) dry_run = true;
    else if (strcmp(argv[i], "--list") == 0) list = true;
    else if (strcmp(argv[i], "--") == 0)
    {
      file_at = i + 1;
      break;
    }
    else if (argv[i][0] == '-' && argv[i][1] != '\0')
    {
      std::cerr << "sbx_run: unknown option: " << argv[i] << std::endl;
      print_usage(argv[0]);
      return 2;
    }
    else
    {
      file_at = i; // first non-option is the file, the rest go to the program
      break;
    }
  }
  if (!list && (file_at < 0 || file_at >= argc))
  {
    print_usage(argv[0]);
    return 2;
  }

  env_c env = env_c::from_env_();
  try
  {
    sbx_a::log_(env);
    sbx_a app(env);
    if (list)
    {
      for (const auto& [name, profile] : app.registry_().profiles_())
      {
        std::cout << name << "\t" << profile.image << "\t";
        for (size_t i = 0; i < profile.extensions.size(); i++) std::cout << (i ? "," : "") << profile.extensions[i];
        std::cout << std::endl;
      }
      return 0;
    }
    std::string file = argv[file_at];
    std::vector<std::string> args(argv + file_at + 1, argv + argc);
    if (dry_run)
    {
      sbx_i plan = language.empty() ? app.plan_extension_(file, args) : app.plan_(language, sbx_q{language, file, args});
      std::cout << plan.dump_() << std::endl;
      return 0;
    }
    sbx_r result = language.empty() ? app.run_extension_(file, args) : app.run_language_(language, file, args);
    std::cout << result.output << std::flush;
    return 0;
  }
  catch (const sbx_e_timeout& e)
  {
    std::cerr << "sbx_run: " << e.what() << std::endl;
    return 124;
  }
  catch (const sbx_e_execution& e)
  {
    if (e.context.contains("output")) std::cout << e.context["output"].get<std::string>() << std::flush;
    std::cerr << "sbx_run: " << e.what() << std::endl;
    int code = e.context.value("exit_code", -1);
    return code > 0 ? code : 1;
  }
  catch (const sbx_e_language& e)
  {
    std::cerr << "sbx_run: " << e.what() << " (known: " << e.context["known"].dump() << ")" << std::endl;
    return 2;
  }
  catch (const sbx_e_extension& e)
  {
    std::cerr << "sbx_run: " << e.what() << " (known: " << e.context["known"].dump() << ")" << std::endl;
    return 2;
  }
  catch (const sbx_e_path& e)
  {
    std::cerr << "sbx_run: " << e.what() << std::endl;
    return 2;
  }
  catch (const sbx_e& e)
  {
    std::cerr << "sbx_run: " << e.kind << ": " << e.what() << std::endl;
    return 1;
  }
  catch (const std::exception& e)
  {
    std::cerr << "sbx_run: " << e.what() << std::endl;
    return 1;
  }
}

#include "../include/sbx_a_path.hh"
#include "../include/sbx_a_limit.hh"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

static bool rejects(const grd_t& _guard, const std::string& _path)
{
  try { _guard.resolve_(_path); }
  catch (const sbx_e_path&) { return true; }
  return false;
}

int main(int argc, char** argv)
{

fs::path root = fs::canonical(fs::temp_directory_path()) / ("sbx_a_test_2_" + std::to_string(getpid()));
fs::path work = root / "project";
fs::path sibling = root / "project-x"; // shares the textual prefix of work
fs::create_directories(work / "src");
fs::create_directories(sibling);
std::ofstream(work / "main.go") << "package main\n";
std::ofstream(work / "src" / "app.py") << "print('hi')\n";
std::ofstream(sibling / "steal.py") << "print('no')\n";
std::ofstream(root / "outside.py") << "print('no')\n";
fs::create_symlink(root / "outside.py", work / "link.py");
fs::create_symlink(work / "src" / "app.py", work / "inner.py");
log_t::get_().init_((root / "sbx_a.log").string(), false, log_v::debug);

std::cout << "=== Test 1: Paths Inside the Tree ===" << std::endl;
{
  grd_t guard(work);
  assert(guard.workdir_() == work);
  fs::path a = guard.resolve_("main.go");
  assert(a.is_absolute() && a == work / "main.go");
  fs::path b = guard.resolve_((work / "src" / "app.py").string());
  assert(b == work / "src" / "app.py");
  fs::path c = guard.resolve_("src/../main.go");
  assert(c == work / "main.go");
  fs::path d = guard.resolve_("inner.py"); // symlink staying inside
  assert(d == work / "src" / "app.py");
  assert(guard.relative_(b) == fs::path("src/app.py"));
  std::cout << "✓ Relative, absolute, dotted and inner symlink paths resolve absolute" << std::endl;
}

std::cout << "\n=== Test 2: Paths Outside the Tree ===" << std::endl;
{
  grd_t guard(work);
  assert(rejects(guard, "../outside.py"));
  assert(rejects(guard, (root / "outside.py").string()));
  assert(rejects(guard, "../project-x/steal.py"));
  assert(rejects(guard, "link.py")); // symlink escaping the tree
  assert(rejects(guard, "/etc/passwd"));
  std::cout << "✓ Escapes via .., absolute paths, sibling prefixes and symlinks rejected" << std::endl;
}

std::cout << "\n=== Test 3: Missing, Blank and Non-file Paths ===" << std::endl;
{
  grd_t guard(work);
  assert(rejects(guard, "nope.go"));
  assert(rejects(guard, ""));
  assert(rejects(guard, "   "));
  assert(rejects(guard, "src"));
  assert(rejects(guard, "."));
  try
  {
    guard.resolve_("nope.go");
    assert(false);
  }
  catch (const sbx_e_path& e)
  {
    assert(e.kind == "PathError");
    assert(e.context["path"] == "nope.go");
  }
  std::cout << "✓ Missing files, blanks and directories rejected" << std::endl;
}

std::cout << "\n=== Test 4: Containment Check ===" << std::endl;
{
  assert(grd_t::within_("/work/project", "/work/project/a.py"));
  assert(grd_t::within_("/work/project", "/work/project"));
  assert(!grd_t::within_("/work/project", "/work/project-x/a.py"));
  assert(!grd_t::within_("/work/project", "/work"));
  assert(grd_t::within_("/", "/etc/passwd"));
  std::cout << "✓ Component-wise prefix containment" << std::endl;
}

std::cout << "\n=== Test 5: Default Working Directory ===" << std::endl;
{
  fs::path before = fs::current_path();
  fs::current_path(work);
  grd_t guard;
  assert(guard.workdir_() == work);
  assert(guard.resolve_("main.go") == work / "main.go");
  fs::current_path(before);
  try
  {
    grd_t missing(root / "absent");
    assert(false);
  }
  catch (const sbx_e_path&) {}
  std::cout << "✓ Defaults to the process working directory" << std::endl;
}

std::cout << "\n=== Test 6: Resource Limits ===" << std::endl;
{
  sbx_p p;
  p.name = "go";
  p.cpu = 1.0;
  p.memory = "512m";
  p.timeout = 30;
  sbx_l l = lim_t::derive_(p);
  assert(l.cpu == 1.0 && l.memory == "512m" && l.timeout == 30);
  std::cout << "✓ Declared limits pass through" << std::endl;

  sbx_p unset;
  unset.name = "bare";
  unset.cpu = 0;
  unset.memory = "";
  unset.timeout = 0;
  l = lim_t::derive_(unset);
  assert(l.cpu == 0.5 && l.memory == "256m" && l.timeout == 300);
  std::cout << "✓ Unset fields take cpu=0.5 memory=256m timeout=300" << std::endl;

  sbx_p wide = p;
  wide.cpu = 12.0;
  l = lim_t::derive_(wide);
  assert(l.cpu == 12.0);
  std::cout << "✓ Out-of-range cpu kept (warned)" << std::endl;

  sbx_p mutated = p;
  mutated.memory = "lots";
  try
  {
    lim_t::derive_(mutated);
    assert(false);
  }
  catch (const sbx_e_config& e)
  {
    assert(e.context["memory"] == "lots");
  }
  std::cout << "✓ Memory mutated after load fails the re-check" << std::endl;

  sbx_p starved = p;
  starved.cpu = 1e-7;
  try
  {
    lim_t::derive_(starved);
    assert(false);
  }
  catch (const sbx_e_config& e)
  {
    assert(e.context["cpu"] == 1e-7);
  }
  std::cout << "✓ CPU share below 0.01 fails the re-check" << std::endl;
}

log_t::get_().fina_();
fs::remove_all(root);
std::cout << "\nAll path and limit tests passed." << std::endl;
return 0;
}

#include "test_harness.hpp"
#include "rules.hpp"
#include "parser.hpp"
#include "errors.hpp"
#include <sstream>

static Step make_step(int id, const std::string& layer, Category c){
  Step s;
  s.id = id;
  s.layer = layer;
  s.mapping.fallback = c;
  return s;
}

static Feature feature_with(const std::string& k, const std::string& v){
  Feature f;
  f.id = "f";
  f.attrs[k] = v;
  return f;
}

static void test_validate_accepts_increasing(){
  TEST_BEGIN("rules: strictly increasing ids are accepted");
  RuleTable R;
  R.steps = { make_step(1, "a", PUBLIC), make_step(2, "b", PRIVATE), make_step(10, "c", PUBLIC) };
  bool threw = false;
  try { validate_rules(R); } catch(const std::exception&){ threw = true; }
  TEST_ASSERT(!threw);
  TEST_PASS();
}

static void test_validate_rejects_duplicate(){
  TEST_BEGIN("rules: duplicate step id raises StepOrderError");
  RuleTable R;
  R.steps = { make_step(1, "a", PUBLIC), make_step(1, "b", PRIVATE) };
  bool threw = false;
  try { validate_rules(R); } catch(const StepOrderError&){ threw = true; }
  TEST_ASSERT(threw);
  TEST_PASS();
}

static void test_validate_rejects_decreasing(){
  TEST_BEGIN("rules: non-monotonic step ids raise StepOrderError");
  RuleTable R;
  R.steps = { make_step(5, "a", PUBLIC), make_step(3, "b", PRIVATE) };
  bool threw = false;
  try { validate_rules(R); } catch(const StepOrderError&){ threw = true; }
  TEST_ASSERT(threw);
  TEST_PASS();
}

static void test_validate_rejects_unmapped_step(){
  TEST_BEGIN("rules: step without any category is malformed");
  RuleTable R;
  Step s; s.id = 1; s.layer = "a";
  R.steps = { s };
  bool threw = false;
  try { validate_rules(R); } catch(const std::runtime_error&){ threw = true; }
  TEST_ASSERT(threw);
  TEST_PASS();
}

static void test_filter_ops(){
  TEST_BEGIN("rules: filter operators and missing attributes");
  Feature rail = feature_with("functie", "spoorbaan");
  Feature road = feature_with("functie", "rijbaan lokale weg");
  Feature none; none.id = "n";

  AttrFilter eq; eq.op = EQ; eq.attr = "functie"; eq.values = {"spoorbaan"};
  AttrFilter ne = eq; ne.op = NE;
  AttrFilter in; in.op = IN; in.attr = "functie"; in.values = {"fietspad", "spoorbaan"};
  AttrFilter nin = in; nin.op = NOT_IN;
  AttrFilter any;

  TEST_ASSERT(filter_matches(eq, rail) && !filter_matches(eq, road) && !filter_matches(eq, none));
  TEST_ASSERT(!filter_matches(ne, rail) && filter_matches(ne, road) && filter_matches(ne, none));
  TEST_ASSERT(filter_matches(in, rail) && !filter_matches(in, road) && !filter_matches(in, none));
  TEST_ASSERT(!filter_matches(nin, rail) && filter_matches(nin, road) && filter_matches(nin, none));
  TEST_ASSERT(filter_matches(any, none));
  TEST_PASS();
}

static void test_resolve(){
  TEST_BEGIN("rules: resolver table hit, fallback and NoMatch");
  Step s;
  s.id = 4; s.layer = "begroeidterreindeel";
  s.mapping.attr = "fysiek_voorkomen";
  s.mapping.table["loofbos"] = PUBLIC;
  s.mapping.table["erf"] = PRIVATE;

  auto a = resolve(s, feature_with("fysiek_voorkomen", "loofbos"));
  auto b = resolve(s, feature_with("fysiek_voorkomen", "erf"));
  auto c = resolve(s, feature_with("fysiek_voorkomen", "akker"));
  Feature bare; bare.id = "bare";
  TEST_ASSERT(a && *a == PUBLIC);
  TEST_ASSERT(b && *b == PRIVATE);
  TEST_ASSERT(!c);
  TEST_ASSERT(!resolve(s, bare));

  s.mapping.fallback = PRIVATE;
  auto d = resolve(s, feature_with("fysiek_voorkomen", "akker"));
  TEST_ASSERT(d && *d == PRIVATE);
  TEST_ASSERT(source_value(s, feature_with("fysiek_voorkomen", "akker")) == "akker");
  TEST_PASS();
}

static void test_parse_rule_stream(){
  TEST_BEGIN("parser: rule file with quotes, comments and precedence");
  std::istringstream in(
    "# example\n"
    "Step 1\n"
    "Layer functioneelgebied\n"
    "Source top10nl\n"
    "Reason functional area of a non-public kind\n"
    "Filter typefunctioneelgebied in \"camping, kampeerterrein\" \"golfterrein\"  # two values\n"
    "Default PRIVATE\n"
    "Optional\n"
    "\n"
    "Step 2\n"
    "Layer wegdeel\n"
    "Filter functie ne \"spoorbaan\"\n"
    "Map functie\n"
    "Value \"rijbaan lokale weg\" PUBLIC\n"
    "Value \"#hash\" private\n"
    "Precedence PRIVATE PUBLIC\n");
  RuleTable R = parse_rule_stream(in, "inline");
  TEST_ASSERT(R.steps.size() == 2);
  const Step& a = R.steps[0];
  TEST_ASSERT(a.id == 1 && a.layer == "functioneelgebied" && a.source == "top10nl");
  TEST_ASSERT(a.reason == "functional area of a non-public kind");
  TEST_ASSERT(a.filter.op == IN && a.filter.values.size() == 2);
  TEST_ASSERT(a.filter.values[0] == "camping, kampeerterrein");
  TEST_ASSERT(a.mapping.fallback && *a.mapping.fallback == PRIVATE);
  TEST_ASSERT(a.optional);
  const Step& b = R.steps[1];
  TEST_ASSERT(b.filter.op == NE && b.filter.values[0] == "spoorbaan");
  TEST_ASSERT(b.mapping.attr == "functie" && b.mapping.table.size() == 2);
  TEST_ASSERT(b.mapping.table.at("#hash") == PRIVATE);
  TEST_ASSERT(b.precedence.size() == 2 && b.precedence[0] == PRIVATE);
  TEST_ASSERT(!b.optional);
  TEST_PASS();
}

static void test_parse_rule_errors(){
  TEST_BEGIN("parser: malformed rule lines report file and line");
  std::istringstream bad("Step 1\nLayer a\nDefault PUBLIC\nColour red\n");
  std::string msg;
  try { parse_rule_stream(bad, "bad.rules"); } catch(const std::runtime_error& e){ msg = e.what(); }
  TEST_ASSERT(msg.find("bad.rules:4") != std::string::npos);

  std::istringstream cat("Step 1\nLayer a\nDefault UNASSIGNED\n");
  msg.clear();
  try { parse_rule_stream(cat, "cat.rules"); } catch(const std::runtime_error& e){ msg = e.what(); }
  TEST_ASSERT(msg.find("cat.rules:3") != std::string::npos);

  std::istringstream order("Step 2\nLayer a\nDefault PUBLIC\nStep 2\nLayer b\nDefault PRIVATE\n");
  bool threw = false;
  try { parse_rule_stream(order, "order.rules"); } catch(const StepOrderError&){ threw = true; }
  TEST_ASSERT(threw);
  TEST_PASS();
}

int main(){
  std::printf("\n--- rule table and category resolver ---\n");
  test_validate_accepts_increasing();
  test_validate_rejects_duplicate();
  test_validate_rejects_decreasing();
  test_validate_rejects_unmapped_step();
  test_filter_ops();
  test_resolve();
  test_parse_rule_stream();
  test_parse_rule_errors();
  TEST_SUMMARY();
  return g_testsFailed > 0 ? 1 : 0;
}

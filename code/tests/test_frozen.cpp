#include "test_harness.hpp"
#include "frozen.hpp"
#include "geom.hpp"
#include "errors.hpp"

static void test_commit_returns_new_area(){
  TEST_BEGIN("frozen: commit returns exactly the newly added geometry");
  FrozenStore st(1e-4);
  MPoly a = st.commit(0, PRIVATE, rect(0,0,10,10));
  TEST_ASSERT_NEAR(area_of(a), 100.0, 1e-9);
  MPoly b = st.commit(1, PUBLIC, rect(5,0,15,10));
  TEST_ASSERT_NEAR(area_of(b), 50.0, 1e-9);
  TEST_ASSERT_NEAR(area_of(intersect(b, rect(0,0,10,10))), 0.0, 1e-9);
  TEST_ASSERT_NEAR(st.area(PRIVATE), 100.0, 1e-9);
  TEST_ASSERT_NEAR(st.area(PUBLIC), 50.0, 1e-9);
  TEST_ASSERT_NEAR(area_of(st.already_decided()), 150.0, 1e-9);
  TEST_ASSERT(st.log().size() == 2);
  TEST_PASS();
}

static void test_first_commit_wins(){
  TEST_BEGIN("frozen: later commits never take frozen area, any category");
  FrozenStore st(1e-4);
  st.commit(0, PUBLIC, rect(0,0,4,4));
  MPoly same = st.commit(1, PUBLIC, rect(0,0,4,4));
  MPoly other = st.commit(2, PRIVATE, rect(0,0,4,4));
  TEST_ASSERT(same.empty());
  TEST_ASSERT(other.empty());
  TEST_ASSERT_NEAR(st.area(PRIVATE), 0.0, 0.0);
  TEST_ASSERT(st.log().size() == 1);
  TEST_PASS();
}

static void test_commit_idempotent(){
  TEST_BEGIN("frozen: committing the same geometry twice is a no-op");
  FrozenStore once(1e-4), twice(1e-4);
  MPoly g = rect(1,1,7,3);
  g.push_back(rect(2,5,4,9).front());
  once.commit(0, PRIVATE, g);
  twice.commit(0, PRIVATE, g);
  MPoly second = twice.commit(0, PRIVATE, g);
  TEST_ASSERT(second.empty());
  TEST_ASSERT(twice.log().size() == once.log().size());
  TEST_ASSERT_NEAR(twice.area(PRIVATE), once.area(PRIVATE), 1e-9);
  MPoly diff;
  bg::sym_difference(once.region(PRIVATE), twice.region(PRIVATE), diff);
  TEST_ASSERT(area_of(diff) < 1e-9);
  TEST_PASS();
}

static void test_sliver_suppressed(){
  TEST_BEGIN("frozen: remainder under the sliver tolerance is discarded");
  FrozenStore st(1e-2);
  st.commit(0, PRIVATE, rect(0,0,10,10));
  double sliver = -1;
  // remainder is a 0.0005 x 10 strip
  MPoly d = st.commit(1, PUBLIC, rect(0,0,10.0005,10), {"strip"}, &sliver);
  TEST_ASSERT(d.empty());
  TEST_ASSERT_NEAR(sliver, 0.005, 1e-6);
  TEST_ASSERT_NEAR(st.area(PUBLIC), 0.0, 0.0);
  TEST_ASSERT(st.log().size() == 1);
  TEST_PASS();
}

static void test_sliver_parts_dropped_keep_rest(){
  TEST_BEGIN("frozen: sliver parts dropped, real remainder kept");
  FrozenStore st(1e-2);
  st.commit(0, PRIVATE, rect(0,0,10,10));
  MPoly g = rect(10,0,20,10);                 // real
  g.push_back(rect(30,0,30.001,1).front());   // 0.001
  double sliver = 0;
  MPoly d = st.commit(1, PUBLIC, g, {}, &sliver);
  TEST_ASSERT(d.size() == 1);
  TEST_ASSERT_NEAR(area_of(d), 100.0, 1e-9);
  TEST_ASSERT_NEAR(sliver, 0.001, 1e-9);
  TEST_PASS();
}

static void test_monotonic_growth(){
  TEST_BEGIN("frozen: category areas never decrease");
  FrozenStore st(1e-4);
  double last[2] = {0,0};
  MPoly inputs[] = { rect(0,0,3,3), rect(2,2,6,6), rect(0,0,6,6), rect(5,0,9,2), rect(1,1,2,2) };
  for(int i=0;i<5;++i){
    st.commit(i, i%2 ? PUBLIC : PRIVATE, inputs[i]);
    TEST_ASSERT(st.area(PUBLIC) >= last[PUBLIC]);
    TEST_ASSERT(st.area(PRIVATE) >= last[PRIVATE]);
    last[PUBLIC] = st.area(PUBLIC);
    last[PRIVATE] = st.area(PRIVATE);
  }
  TEST_ASSERT_NEAR(area_of(intersect(st.region(PUBLIC), st.region(PRIVATE))), 0.0, 1e-9);
  TEST_PASS();
}

static void test_decided_near(){
  TEST_BEGIN("frozen: decided_near only returns nearby pieces");
  FrozenStore st(1e-4);
  st.commit(0, PRIVATE, rect(0,0,1,1));
  st.commit(1, PUBLIC, rect(100,100,101,101));
  Box bb(Point(-1,-1), Point(2,2));
  MPoly near = st.decided_near(bb);
  TEST_ASSERT_NEAR(area_of(near), 1.0, 1e-9);
  Box far(Point(50,50), Point(60,60));
  TEST_ASSERT(st.decided_near(far).empty());
  TEST_PASS();
}

static void test_sealed_and_unassigned(){
  TEST_BEGIN("frozen: sealed store and UNASSIGNED category refuse commits");
  FrozenStore st(1e-4);
  bool threw = false;
  try { st.commit(0, UNASSIGNED, rect(0,0,1,1)); } catch(const std::invalid_argument&){ threw = true; }
  TEST_ASSERT(threw);
  st.seal();
  threw = false;
  try { st.commit(0, PUBLIC, rect(0,0,1,1)); } catch(const EngineStateError&){ threw = true; }
  TEST_ASSERT(threw);
  TEST_ASSERT(st.log().empty());
  TEST_PASS();
}

static void test_replay_rebuilds_store(){
  TEST_BEGIN("frozen: replaying the log rebuilds the same regions");
  FrozenStore st(1e-4);
  st.commit(0, PRIVATE, rect(0,0,10,10), {"a"});
  st.commit(1, PUBLIC, rect(5,5,20,20), {"b", "c"});
  st.commit(2, PRIVATE, rect(-5,-5,30,0), {"d"});

  FrozenStore copy(1e-4);
  for(const auto& e : st.log()) copy.replay(e);
  for(Category c : {PUBLIC, PRIVATE}){
    TEST_ASSERT_NEAR(copy.area(c), st.area(c), 1e-9);
    MPoly diff;
    bg::sym_difference(copy.region(c), st.region(c), diff);
    TEST_ASSERT(area_of(diff) < 1e-9);
  }
  TEST_ASSERT(copy.log().size() == 3 && copy.log()[1].sources.size() == 2);
  // a later commit sees the replayed area as decided
  TEST_ASSERT(copy.commit(3, PUBLIC, rect(0,0,10,10)).empty());
  TEST_PASS();
}

int main(){
  std::printf("\n--- frozen region store ---\n");
  test_commit_returns_new_area();
  test_first_commit_wins();
  test_commit_idempotent();
  test_sliver_suppressed();
  test_sliver_parts_dropped_keep_rest();
  test_monotonic_growth();
  test_decided_near();
  test_sealed_and_unassigned();
  test_replay_rebuilds_store();
  TEST_SUMMARY();
  return g_testsFailed > 0 ? 1 : 0;
}
